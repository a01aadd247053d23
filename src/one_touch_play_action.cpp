// -----------------------------------------------------------------------------
// one_touch_play_action.cpp: OneTouchPlayAction
//
// Sequence diagram: include/cecflow/one_touch_play_action.hpp
// -----------------------------------------------------------------------------
#include "cecflow/one_touch_play_action.hpp"
#include "cecflow/local_device.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/log.hpp"

namespace cecflow {

std::unique_ptr<OneTouchPlayAction> OneTouchPlayAction::create(LocalDevice& device,
                                                               uint8_t target_address) {
  return std::unique_ptr<OneTouchPlayAction>(new OneTouchPlayAction(device, target_address));
}

OneTouchPlayAction::OneTouchPlayAction(LocalDevice& device, uint8_t target_address)
: FeatureAction(device, target_address) {
}

bool OneTouchPlayAction::start() {
  send_command(build_text_view_on(source_address(), target_address()),
               [this](TransportResult r) { on_wake_sent(r); });

  broadcast_active_source();

  // optimistic: we just told everyone we are the source
  device().set_active_source(source_address(), source_path());
  device().set_routing_port(CEC_SWITCH_HOME);
  device().set_local_active_port(CEC_SWITCH_HOME);

  enter_state(STATE_WAITING_FOR_REPORT_POWER_STATUS);
  query_power_status();
  add_timer(response_timeout_ms());
  return true;
}

// -----------------------------------------------------------------------------
// process_command(): only <Report Power Status> from the display, while waiting.
// POLICY:
//   - Any report from the target is ours to claim, even when it is not ON yet;
//     a later query will ask again.
//   - A report without its status byte is not understood, so not claimed.
// -----------------------------------------------------------------------------
bool OneTouchPlayAction::process_command(const CecMessage& cmd) {
  if (state_ != STATE_WAITING_FOR_REPORT_POWER_STATUS) return false;
  if (cmd.source() != target_address()) return false;
  if (cmd.opcode() != OP_REPORT_POWER_STATUS) return false;
  if (cmd.params().empty()) return false;

  const int status = cmd.params()[0];
  log_debug("action=", name(), " id=", id(), " event=power_status status=", status,
            " queries=", int(queries_sent_));
  if (status == POWER_STATUS_ON) {
    broadcast_active_source();
    finish_with_result(RESULT_SUCCESS);
  }
  return true;
}

void OneTouchPlayAction::handle_timer_event(uint8_t state) {
  if (state != STATE_WAITING_FOR_REPORT_POWER_STATUS) return;

  if (queries_sent_ < device().config().power_status_loop_max) {
    enter_state(STATE_WAITING_FOR_REPORT_POWER_STATUS);
    query_power_status();
    add_timer(response_timeout_ms());
    return;
  }
  log_info("action=", name(), " id=", id(), " event=timeout queries=", int(queries_sent_));
  finish_with_result(RESULT_TIMEOUT);
}

void OneTouchPlayAction::broadcast_active_source() {
  send_command(build_active_source(source_address(), source_path()));
}

void OneTouchPlayAction::query_power_status() {
  ++queries_sent_;
  send_command(build_give_device_power_status(source_address(), target_address()));
}

void OneTouchPlayAction::on_wake_sent(TransportResult r) {
  if (r == TransportResult::Success) return;
  if (state_ != STATE_WAITING_FOR_REPORT_POWER_STATUS) return;
  log_info("action=", name(), " id=", id(), " event=wake_failed transport=", int(r));
  finish_with_result(negate(r));
}

} // namespace cecflow
