// -----------------------------------------------------------------------------
// power_status_action.cpp: PowerStatusAction
// -----------------------------------------------------------------------------
#include "cecflow/power_status_action.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/log.hpp"

namespace cecflow {

std::unique_ptr<PowerStatusAction> PowerStatusAction::create(LocalDevice& device,
                                                             uint8_t target_address) {
  return std::unique_ptr<PowerStatusAction>(new PowerStatusAction(device, target_address));
}

PowerStatusAction::PowerStatusAction(LocalDevice& device, uint8_t target_address)
: FeatureAction(device, target_address) {
}

bool PowerStatusAction::start() {
  send_command(build_give_device_power_status(source_address(), target_address()),
               [this](TransportResult r) { on_sent(r); });
  enter_state(STATE_WAITING_FOR_REPORT_POWER_STATUS);
  add_timer(response_timeout_ms());
  return true;
}

bool PowerStatusAction::process_command(const CecMessage& cmd) {
  if (state_ != STATE_WAITING_FOR_REPORT_POWER_STATUS) return false;
  if (cmd.source() != target_address()) return false;
  if (cmd.opcode() != OP_REPORT_POWER_STATUS || cmd.params().empty()) return false;

  int status = cmd.params()[0];
  if (status > POWER_STATUS_TRANSIENT_TO_STANDBY) {
    log_warn("action=", name(), " id=", id(), " event=bad_power_status value=", status);
    status = POWER_STATUS_UNKNOWN;
  }
  finish_with_result(status);
  return true;
}

void PowerStatusAction::handle_timer_event(uint8_t state) {
  if (state != STATE_WAITING_FOR_REPORT_POWER_STATUS) return;
  log_info("action=", name(), " id=", id(), " event=timeout");
  finish_with_result(POWER_STATUS_UNKNOWN);
}

void PowerStatusAction::on_sent(TransportResult r) {
  if (r == TransportResult::Success) return;
  if (state_ != STATE_WAITING_FOR_REPORT_POWER_STATUS) return;
  log_info("action=", name(), " id=", id(), " event=send_failed transport=", int(r));
  finish_with_result(POWER_STATUS_UNKNOWN);
}

} // namespace cecflow
