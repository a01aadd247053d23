// -----------------------------------------------------------------------------
// standby_action.cpp: StandbyAction
// -----------------------------------------------------------------------------
#include "cecflow/standby_action.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/log.hpp"

namespace cecflow {

std::unique_ptr<StandbyAction> StandbyAction::create(LocalDevice& device, uint8_t target_address) {
  return std::unique_ptr<StandbyAction>(new StandbyAction(device, target_address));
}

StandbyAction::StandbyAction(LocalDevice& device, uint8_t target_address)
: FeatureAction(device, target_address) {
}

bool StandbyAction::start() {
  send_command(build_standby(source_address(), target_address()),
               [this](TransportResult r) { on_sent(r); });
  enter_state(STATE_WAITING_FOR_ACK);
  add_timer(response_timeout_ms());
  return true;
}

void StandbyAction::on_sent(TransportResult r) {
  if (state_ != STATE_WAITING_FOR_ACK) return;
  if (r == TransportResult::Success) return;   // keep waiting for the timer
  log_info("action=", name(), " id=", id(), " event=send_failed transport=", int(r));
  finish_with_result(negate(r));
}

void StandbyAction::handle_timer_event(uint8_t state) {
  if (state != STATE_WAITING_FOR_ACK) return;
  log_info("action=", name(), " id=", id(), " event=no_ack");
  finish_with_result(RESULT_NO_ACK);
}

} // namespace cecflow
