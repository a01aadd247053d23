/**
 * @file feature_action.hpp
 * @brief FeatureAction: the contract every protocol sequence implements, plus its runtime.
 *
 * @details
 * ## Field Brief
 * A feature action is one bounded conversation on the bus: send something,
 * wait for an answer or a timeout, maybe try again, then report one result to
 * everyone who asked. Several actions run side by side on one local device;
 * the device routes bus traffic and timer expirations back into them.
 *
 * ---
 *
 * @par The contract (what subclasses write)
 * - `kind()`               closed tag: which protocol behaviour this is.
 * - `start()`              send the first command(s), enter the first state,
 *                          arm the first timer. Return false to refuse.
 * - `process_command(cmd)` look at one inbound message; return true to claim
 *                          it. Always check the current state *and* that the
 *                          message comes from the target before acting.
 * - `handle_timer_event(state)` react to a timeout of the current state.
 *
 * @par The runtime (what subclasses call)
 * - `enter_state(s)`       move to state `s`; starts a new state occurrence.
 * - `add_timer(ms)`        arm the action's single timer for the current occurrence.
 * - `send_command(msg, done)` non-blocking send; `done` runs later, only if
 *                          the action is still live.
 * - `invoke_callbacks(r)`  deliver `r` to every attached caller, once.
 * - `finish()`             terminal and idempotent; disarms the timer and
 *                          unregisters the action.
 *
 * ---
 *
 * @par Stale timers
 * The runtime checks every timer event against the current state occurrence
 * before `handle_timer_event()` runs. A timer armed for an occurrence that has
 * since been left (a reply moved the state on, or the state was re-entered)
 * is dropped. Subclasses only ever see timeouts of the state they are in.
 *
 * @par Threading
 * None. All hooks run on the thread driving the local device.
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <memory>

#include "cec_message.hpp"
#include "control_callback.hpp"
#include "action_timer.hpp"
#include "transport/bus_transport.hpp"

namespace cecflow {

class LocalDevice;

/// The closed set of protocol behaviours the engine runs.
enum class ActionKind : uint8_t {
  OneTouchPlay = 0,
  Standby,
  PowerStatus
};

/// Log label for an action kind ("one_touch_play", "standby", "power_status").
const char* action_kind_name(ActionKind kind);

class FeatureAction {
public:
  static constexpr uint8_t STATE_NONE = 0;   ///< Before start(); shared by all actions.

  virtual ~FeatureAction() = default;
  FeatureAction(const FeatureAction&) = delete;
  FeatureAction& operator=(const FeatureAction&) = delete;

  // -------- contract --------

  virtual ActionKind kind() const = 0;
  virtual bool start() = 0;
  virtual bool process_command(const CecMessage& cmd) = 0;

  // -------- driven by the local device --------

  /// Timer expiry for `token`; dropped unless it matches the current state occurrence.
  void on_timer_fired(const TimerToken& token);

  /// Terminal. Safe to call more than once.
  void finish();

  /// Deliver `result` to every caller and finish.
  void cancel(int result);

  /// Attach another caller. False once a result was delivered or the action finished.
  bool add_callback(std::shared_ptr<ControlCallback> cb);

  // -------- inspection --------

  uint32_t   id() const             { return id_; }
  uint8_t    target_address() const { return target_; }
  uint8_t    state() const          { return state_; }
  uint32_t   generation() const     { return generation_; }
  bool       is_finished() const    { return finished_; }
  bool       accepts_callbacks() const { return !finished_ && !callbacks_.delivered(); }
  /// Not finished and not delivering its result; what the registry counts.
  bool       is_live() const        { return accepts_callbacks(); }
  size_t     callback_count() const { return callbacks_.size(); }
  TimerToken current_token() const  { return TimerToken{state_, generation_}; }
  const char* name() const          { return action_kind_name(kind()); }

protected:
  FeatureAction(LocalDevice& device, uint8_t target_address);

  virtual void handle_timer_event(uint8_t state) = 0;

  // -------- runtime --------

  void enter_state(uint8_t state);
  void add_timer(uint32_t delay_ms);
  void send_command(const CecMessage& msg, transport::SendCallback done = nullptr);
  void invoke_callbacks(int result);
  void finish_with_result(int result);

  LocalDevice&       device()       { return device_; }
  const LocalDevice& device() const { return device_; }
  uint8_t  source_address() const;
  uint16_t source_path() const;
  uint32_t response_timeout_ms() const;

  uint8_t state_{STATE_NONE};

private:
  LocalDevice& device_;
  uint32_t     id_;
  uint8_t      target_;
  uint32_t     generation_{0};
  bool         finished_{false};
  CallbackList callbacks_;
};

} // namespace cecflow
