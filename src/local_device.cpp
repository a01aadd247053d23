// -----------------------------------------------------------------------------
// local_device.cpp: registry, dispatcher and clock of one logical device.
//
// API & operational model:
//   see include/cecflow/local_device.hpp
//
// Actions may finish (and ask to be removed) from anywhere below a
// DispatchScope: start(), process_command(), a timer, a send completion, a
// callback that clears the device. Removal only marks; the outermost scope
// destroys finished actions once nothing of theirs is on the stack.
// -----------------------------------------------------------------------------
#include "cecflow/local_device.hpp"
#include "cecflow/log.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/one_touch_play_action.hpp"
#include "cecflow/standby_action.hpp"
#include "cecflow/power_status_action.hpp"

#include <algorithm>

namespace cecflow {

LocalDevice::DispatchScope::~DispatchScope() {
  if (--dev_.dispatch_depth_ == 0 && dev_.purge_pending_) {
    dev_.purge_finished();
  }
}

LocalDevice::LocalDevice(transport::BusTransport& bus, const DeviceConfig& config)
: bus_(bus), config_(config) {
  actions_.reserve(MAX_LIVE_ACTIONS);
}

LocalDevice::~LocalDevice() {
  if (action_count() > 0) {
    log_warn("event=device_destroyed live_actions=", action_count());
  }
}

// ---------- operations ----------

bool LocalDevice::one_touch_play(std::shared_ptr<ControlCallback> cb) {
  const uint8_t target = config_.tv_address;
  return start_or_merge(ActionKind::OneTouchPlay, target, std::move(cb), [this, target] {
    return std::unique_ptr<FeatureAction>(OneTouchPlayAction::create(*this, target));
  });
}

bool LocalDevice::standby(uint8_t target, std::shared_ptr<ControlCallback> cb) {
  if (target > ADDR_MAX) {
    log_warn("op=standby event=refused reason=bad_target target=", int(target));
    return false;
  }
  return start_or_merge(ActionKind::Standby, target, std::move(cb), [this, target] {
    return std::unique_ptr<FeatureAction>(StandbyAction::create(*this, target));
  });
}

bool LocalDevice::query_display_status(std::shared_ptr<ControlCallback> cb) {
  const uint8_t target = config_.tv_address;
  return start_or_merge(ActionKind::PowerStatus, target, std::move(cb), [this, target] {
    return std::unique_ptr<FeatureAction>(PowerStatusAction::create(*this, target));
  });
}

// -----------------------------------------------------------------------------
// start_or_merge(): attach to a compatible live action or start a new one.
// PRE:    `cb` non-null.
// POLICY:
//   - Compatible = same kind, same target, result not yet delivered.
//   - A merged caller gets exactly what the running action delivers; no
//     second set of commands goes on the bus.
//   - The callback is attached before start() so a start that completes
//     immediately still reaches it.
// -----------------------------------------------------------------------------
bool LocalDevice::start_or_merge(ActionKind kind, uint8_t target,
                                 std::shared_ptr<ControlCallback> cb,
                                 const ActionFactory& make) {
  if (!cb) {
    log_warn("op=", action_kind_name(kind), " event=refused reason=null_callback");
    return false;
  }

  if (FeatureAction* live = find_action(kind, target)) {
    if (live->add_callback(cb)) {
      log_info("op=", action_kind_name(kind), " event=merged id=", live->id(),
               " target=", int(target), " callers=", live->callback_count());
      return true;
    }
  }

  std::unique_ptr<FeatureAction> action = make();
  if (!action || !action->add_callback(std::move(cb))) return false;
  return add_and_start(std::move(action));
}

size_t LocalDevice::clear_actions(int result) {
  DispatchScope scope(*this);
  size_t cancelled = 0;
  // index loop: a callback may start new actions while we walk
  const size_t n = actions_.size();
  for (size_t i = 0; i < n; ++i) {
    FeatureAction* a = actions_[i].get();
    if (!a->is_live()) continue;
    a->cancel(result);
    ++cancelled;
  }
  if (cancelled) log_info("event=clear_actions count=", cancelled, " result=", result);
  return cancelled;
}

// ---------- registry ----------

bool LocalDevice::add_and_start(std::unique_ptr<FeatureAction> action) {
  if (!action) return false;
  if (action_count() >= MAX_LIVE_ACTIONS) {
    log_warn("action=", action->name(), " event=refused reason=registry_full live=",
             action_count());
    return false;
  }

  DispatchScope scope(*this);
  FeatureAction* a = action.get();
  actions_.push_back(std::move(action));
  log_info("action=", a->name(), " id=", a->id(), " event=start target=",
           int(a->target_address()));

  if (!a->start()) {
    log_warn("action=", a->name(), " id=", a->id(), " event=start_refused");
    a->finish();
    return false;
  }
  return true;
}

FeatureAction* LocalDevice::find_action(ActionKind kind, uint8_t target) {
  for (auto& a : actions_) {
    if (a->kind() == kind && a->target_address() == target && a->accepts_callbacks()) {
      return a.get();
    }
  }
  return nullptr;
}

FeatureAction* LocalDevice::find_action_by_id(uint32_t action_id) {
  for (auto& a : actions_) {
    if (a->id() == action_id && !a->is_finished()) return a.get();
  }
  return nullptr;
}

size_t LocalDevice::action_count() const {
  size_t n = 0;
  for (const auto& a : actions_) if (a->is_live()) ++n;
  return n;
}

size_t LocalDevice::action_count(ActionKind kind) const {
  size_t n = 0;
  for (const auto& a : actions_) if (a->is_live() && a->kind() == kind) ++n;
  return n;
}

// ---------- inbound ----------

bool LocalDevice::add_incoming(const CecMessage& msg) {
  // PRE: only well-formed frames get past the boundary
  if (!msg.valid()) {
    log_warn("event=drop reason=invalid_message status=", int(msg.status()), " ", describe(msg));
    return false;
  }
  // POLICY: directly addressed or broadcast; everything else belongs to someone else
  if (!msg.is_broadcast() && msg.destination() != config_.logical_address) {
    log_debug("event=drop reason=not_for_us ", describe(msg));
    return false;
  }
  if (inbox_.full()) {
    log_warn("event=drop reason=inbox_full ", describe(msg));
    return false;
  }
  inbox_.push_back(msg);
  return true;
}

// -----------------------------------------------------------------------------
// dispatch_message(): offer one message to the live actions.
// POLICY:
//   - Registration order; first claim wins, nobody after it sees the message.
//   - Finished actions still in the list are skipped.
//   - Index loop over the size at entry: an action started from inside a
//     hook does not see the message that caused it.
// -----------------------------------------------------------------------------
bool LocalDevice::dispatch_message(const CecMessage& msg) {
  DispatchScope scope(*this);
  const size_t n = actions_.size();
  for (size_t i = 0; i < n; ++i) {
    FeatureAction* a = actions_[i].get();
    if (!a->is_live()) continue;
    if (a->process_command(msg)) {
      log_debug("action=", a->name(), " id=", a->id(), " event=claimed ", describe(msg));
      return true;
    }
  }
  log_debug("event=unclaimed ", describe(msg));
  return false;
}

bool LocalDevice::route_timer(uint32_t action_id, const TimerToken& token) {
  DispatchScope scope(*this);
  FeatureAction* a = find_action_by_id(action_id);
  if (!a) {
    log_debug("event=timer_dropped reason=no_action action_id=", action_id);
    return false;
  }
  a->on_timer_fired(token);
  return true;
}

// tick(): Advance uptime and run one service pass.
void LocalDevice::tick(uint32_t now_ms32) {
  const uint64_t now_ms = static_cast<uint64_t>(now_ms32);

  if (!clock_started_) {             // first tick anchors the clock; 0 is a valid time
    clock_started_ = true;
    last_ms_ = now_ms;
  }
  const uint64_t delta = (now_ms >= last_ms_) ? (now_ms - last_ms_) : 0;   // backwards: ignore
  uptime_ms_ += delta;
  last_ms_ = now_ms;
  ++tick_count_;

  DispatchScope scope(*this);

  // PRE: completions and inbound frames are only produced by poll()
  bus_.poll();
  CecMessage in;
  while (bus_.receive(in)) {
    add_incoming(in);
  }

  process_one();
  fire_due_timers();
}

void LocalDevice::process_one() {
  if (inbox_.empty()) return;
  CecMessage msg = inbox_.front();
  inbox_.pop_front();
  dispatch_message(msg);
}

void LocalDevice::fire_due_timers() {
  ActionTimerQueue::DueList due;
  if (timers_.pop_due(uptime_ms_, due) == 0) return;
  for (const auto& e : due) {
    route_timer(e.action_id, e.token);
  }
}

// ---------- runtime services ----------

void LocalDevice::send(uint32_t action_id, const CecMessage& msg, transport::SendCallback done) {
  log_debug("event=send action_id=", action_id, " transport=", bus_.name(), " ", describe(msg));
  if (!done) {
    bus_.send(msg, nullptr);
    return;
  }
  bus_.send(msg, [this, action_id, done](TransportResult r) {
    DispatchScope scope(*this);
    if (!find_action_by_id(action_id)) {
      log_debug("event=completion_dropped reason=no_action action_id=", action_id,
                " result=", int(r));
      return;
    }
    done(r);
  });
}

bool LocalDevice::arm_timer(uint32_t action_id, const TimerToken& token, uint32_t delay_ms) {
  const uint64_t deadline = uptime_ms_ + delay_ms;
  if (!timers_.arm(action_id, token, deadline)) {
    log_warn("event=timer_refused reason=queue_full action_id=", action_id);
    return false;
  }
  log_debug("event=timer_armed action_id=", action_id, " state=", int(token.state),
            " gen=", token.generation, " deadline=", deadline);
  return true;
}

void LocalDevice::cancel_timer(uint32_t action_id) {
  timers_.cancel(action_id);
}

// remove_action(): mark only; never destroys the caller while it is running.
void LocalDevice::remove_action(uint32_t action_id) {
  log_debug("event=remove_action action_id=", action_id, " depth=", dispatch_depth_);
  purge_pending_ = true;
}

void LocalDevice::purge_finished() {
  purge_pending_ = false;
  actions_.erase(std::remove_if(actions_.begin(), actions_.end(),
                                [](const std::unique_ptr<FeatureAction>& a) {
                                  return a->is_finished();
                                }),
                 actions_.end());
}

// ---------- local state ----------

void LocalDevice::set_active_source(uint8_t logical, uint16_t physical) {
  active_logical_ = logical;
  active_physical_ = physical;
  log_debug("event=active_source logical=", int(logical), " physical=",
            format_physical_address(physical));
}

bool LocalDevice::is_active_source() const {
  return active_logical_ == config_.logical_address &&
         active_physical_ == config_.physical_address;
}

} // namespace cecflow
