// -----------------------------------------------------------------------------
// feature_action.cpp: runtime shared by every FeatureAction.
//
// Contract and overview: include/cecflow/feature_action.hpp
// -----------------------------------------------------------------------------
#include "cecflow/feature_action.hpp"
#include "cecflow/local_device.hpp"
#include "cecflow/log.hpp"

namespace cecflow {

const char* action_kind_name(ActionKind kind) {
  switch (kind) {
    case ActionKind::OneTouchPlay: return "one_touch_play";
    case ActionKind::Standby:      return "standby";
    case ActionKind::PowerStatus:  return "power_status";
  }
  return "unknown";
}

FeatureAction::FeatureAction(LocalDevice& device, uint8_t target_address)
: device_(device),
  id_(device.allocate_action_id()),
  target_(target_address) {
}

// ---------- driven by the local device ----------

void FeatureAction::on_timer_fired(const TimerToken& token) {
  if (finished_) return;

  // POLICY: only the occurrence the timer was armed for may react
  if (token != current_token()) {
    log_debug("action=", name(), " id=", id_, " event=timer_stale state=", int(token.state),
              " gen=", token.generation, " current_state=", int(state_),
              " current_gen=", generation_);
    return;
  }
  log_debug("action=", name(), " id=", id_, " event=timer state=", int(state_));
  handle_timer_event(token.state);
}

void FeatureAction::finish() {
  if (finished_) return;
  finished_ = true;
  log_debug("action=", name(), " id=", id_, " event=finish state=", int(state_));
  device_.cancel_timer(id_);
  device_.remove_action(id_);
}

void FeatureAction::cancel(int result) {
  finish_with_result(result);
}

bool FeatureAction::add_callback(std::shared_ptr<ControlCallback> cb) {
  if (finished_) return false;
  bool ok = callbacks_.add(std::move(cb));
  log_debug("action=", name(), " id=", id_, " event=add_callback ok=", ok ? 1 : 0,
            " count=", callbacks_.size());
  return ok;
}

// ---------- runtime ----------

void FeatureAction::enter_state(uint8_t state) {
  state_ = state;
  ++generation_;
}

void FeatureAction::add_timer(uint32_t delay_ms) {
  if (!device_.arm_timer(id_, current_token(), delay_ms)) {
    // an unarmed wait would never terminate
    log_error("action=", name(), " id=", id_, " event=timer_arm_failed state=", int(state_));
    finish_with_result(RESULT_FAIL);
  }
}

void FeatureAction::send_command(const CecMessage& msg, transport::SendCallback done) {
  device_.send(id_, msg, std::move(done));
}

// finish_with_result(): the timer slot is released before callers run, so a
// callback may start a new action in its place.
void FeatureAction::finish_with_result(int result) {
  if (finished_) return;
  device_.cancel_timer(id_);
  invoke_callbacks(result);
  finish();
}

void FeatureAction::invoke_callbacks(int result) {
  callbacks_.deliver(result, name());
}

uint8_t FeatureAction::source_address() const {
  return device_.logical_address();
}

uint16_t FeatureAction::source_path() const {
  return device_.physical_address();
}

uint32_t FeatureAction::response_timeout_ms() const {
  return device_.config().response_timeout_ms;
}

} // namespace cecflow
