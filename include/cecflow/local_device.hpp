/**
 * @file local_device.hpp
 * @brief LocalDevice: one logical device on the bus: action registry, dispatcher and clock.
 *
 * @details
 * ## Field Brief
 * A playback box on a shared control bus does a handful of things that each
 * take several round trips: wake the display and claim it, put something to
 * standby, ask the display whether it is on. **LocalDevice** runs those
 * conversations as `FeatureAction`s, side by side, against one transport. It
 * owns them, feeds them bus traffic and timeouts, and throws them away when
 * they are done.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  caller ── one_touch_play(cb) ──►  merge into live action of same kind/target
 *                                    or create + start() a new one
 *
 *  tick(now_ms):
 *     bus.poll()        ──► send completions (dropped if the action is gone)
 *     bus.receive()     ──► add_incoming()  ──► inbox (bounded)
 *     process one inbox item ──► dispatch_message(): actions in registration
 *                                order, first process_command() == true wins
 *     pop due timers    ──► route_timer(): owning action only
 *     purge finished actions
 * ```
 *
 * - **At most one** inbound message dispatched per tick, as in any loop built
 *   on this model. Tick faster if replies queue up.
 * - Timers run on the device's own uptime, which only moves inside `tick()`.
 *   Time going backwards is ignored.
 *
 * ---
 *
 * @par Failure Model
 * - **Null callback / registry full / start() refused:** the operation returns
 *   false and the callback is never invoked.
 * - **Invalid inbound frame, or not addressed to us:** dropped and logged.
 * - **Inbox full:** `add_incoming()` returns false.
 * - **Late completion or timer for a finished action:** dropped.
 *
 * ---
 *
 * @par Lifetimes
 * Actions may finish while the device is walking its list (a reply completes
 * one, a callback clears everything). Finished actions stay in the list,
 * marked, until the outermost dispatch pass returns; then they are destroyed.
 * Send completions capture the device: it must outlive any send still pending
 * in the transport.
 *
 * @par Threading
 * None. Every call, including the transport's completions, happens on the
 * thread that calls `tick()`.
 *
 * @par Minimal Usage Example
 * @code
 * cecflow::SimulatedBus bus;
 * cecflow::LocalDevice dev(bus, cecflow::DeviceConfig{});
 * dev.one_touch_play(cecflow::make_callback([](int r) { ... }));
 * for (uint32_t t = 0; !done; t += 10) dev.tick(t);
 * @endcode
 */
#ifndef CECFLOW_LOCAL_DEVICE_HPP
#define CECFLOW_LOCAL_DEVICE_HPP

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <memory>
#include <vector>
#include "etl/deque.h"

#include "cec_constants.hpp"
#include "cec_message.hpp"
#include "config.hpp"
#include "control_callback.hpp"
#include "action_timer.hpp"
#include "feature_action.hpp"
#include "transport/bus_transport.hpp"

namespace cecflow {

class LocalDevice {
public:
  /// @name Capacities
  ///@{
  static constexpr size_t MAX_LIVE_ACTIONS = ActionTimerQueue::CAPACITY; ///< live actions at once
  static constexpr size_t INBOX_CAP        = 16;                         ///< queued inbound messages
  ///@}

  /// Routing port value before any port was selected.
  static constexpr int PORT_UNKNOWN = -1;

  /**
   * @brief Bind a device identity to a transport.
   *
   * `config` is copied. It is not validated here; the CLI and load_config()
   * do that.
   */
  LocalDevice(transport::BusTransport& bus, const DeviceConfig& config);
  ~LocalDevice();

  LocalDevice(const LocalDevice&) = delete;
  LocalDevice& operator=(const LocalDevice&) = delete;

  // ======================== Operations ========================

  /**
   * @brief Wake the display, announce this device as active source, and wait
   *        until the display reports power on.
   *
   * Joins a one touch play already running toward the same display.
   * `cb` gets RESULT_SUCCESS, a negated transport code when the wake command
   * failed, or RESULT_TIMEOUT.
   *
   * @return false when `cb` is null, the registry is full, or start() refused.
   */
  bool one_touch_play(std::shared_ptr<ControlCallback> cb);

  /**
   * @brief Ask `target` to go to standby.
   *
   * `cb` gets a negated transport code on a failed send, or RESULT_NO_ACK when
   * the wait runs out. A successful send alone does not complete the action.
   */
  bool standby(uint8_t target, std::shared_ptr<ControlCallback> cb);

  /// Ask the display for its power status; `cb` gets 0..3 or POWER_STATUS_UNKNOWN.
  bool query_display_status(std::shared_ptr<ControlCallback> cb);

  /**
   * @brief Cancel every live action, delivering `result` to its callers.
   * @return Number of actions cancelled.
   */
  size_t clear_actions(int result = RESULT_CANCELLED);

  // ========================= Registry =========================

  /**
   * @brief Register `action` and call its start().
   *
   * A refused start finishes the action without delivering a result.
   * @return true when the action was registered and started.
   */
  bool add_and_start(std::unique_ptr<FeatureAction> action);

  /// First live action of `kind` toward `target` that still accepts callers.
  FeatureAction* find_action(ActionKind kind, uint8_t target);

  /// Live (not finished) action with this id, or nullptr.
  FeatureAction* find_action_by_id(uint32_t action_id);

  size_t action_count() const;                  ///< live actions
  size_t action_count(ActionKind kind) const;   ///< live actions of one kind
  bool   has_action(ActionKind kind) const { return action_count(kind) > 0; }
  size_t registered_count() const { return actions_.size(); } ///< including finished, not yet purged

  // ========================== Inbound ==========================

  /**
   * @brief Queue one inbound message for the next tick.
   * @return false when the message is invalid, not addressed to this device,
   *         or the inbox is full.
   */
  bool add_incoming(const CecMessage& msg);

  size_t inbox_size() const { return inbox_.size(); }

  /**
   * @brief Offer `msg` to the live actions in registration order.
   * @return true when an action claimed it.
   */
  bool dispatch_message(const CecMessage& msg);

  /**
   * @brief Deliver a timer expiry to the action that armed it.
   * @return false when no live action has this id.
   */
  bool route_timer(uint32_t action_id, const TimerToken& token);

  /// Advance the clock and run one service pass (see Operational Model).
  void tick(uint32_t now_ms);

  uint64_t tick_count() const { return tick_count_; }
  uint64_t uptime_ms() const  { return uptime_ms_; }

  /// Uptime at which the next timer fires; false when none is armed.
  bool next_timer_deadline(uint64_t& out) const { return timers_.next_deadline(out); }

  // ================ Runtime services for actions ================

  /// New unique action id (never 0).
  uint32_t allocate_action_id() { return next_action_id_++; }

  /// Send for `action_id`; `done` runs only while that action is live.
  void send(uint32_t action_id, const CecMessage& msg, transport::SendCallback done);

  /// Arm the single timer of `action_id` to fire `delay_ms` from now.
  bool arm_timer(uint32_t action_id, const TimerToken& token, uint32_t delay_ms);
  void cancel_timer(uint32_t action_id);
  bool is_timer_armed(uint32_t action_id) const { return timers_.is_armed(action_id); }

  /**
   * @brief Called from FeatureAction::finish().
   *
   * The action is destroyed when the outermost dispatch pass (tick, an
   * operation, a routed message or timer) returns, never from inside its
   * own hooks.
   */
  void remove_action(uint32_t action_id);

  // ======================= Local state =======================

  uint8_t  logical_address() const  { return config_.logical_address; }
  uint16_t physical_address() const { return config_.physical_address; }
  uint8_t  tv_address() const       { return config_.tv_address; }
  const DeviceConfig& config() const { return config_; }
  transport::BusTransport& bus() { return bus_; }

  void     set_active_source(uint8_t logical, uint16_t physical);
  bool     is_active_source() const;
  uint8_t  active_source_logical() const  { return active_logical_; }
  uint16_t active_source_physical() const { return active_physical_; }

  void set_routing_port(int port)      { routing_port_ = port; }
  int  routing_port() const            { return routing_port_; }
  void set_local_active_port(int port) { local_active_port_ = port; }
  int  local_active_port() const       { return local_active_port_; }

private:
  /// Marks a pass over the action list; the outermost one purges on exit.
  class DispatchScope {
  public:
    explicit DispatchScope(LocalDevice& dev) : dev_(dev) { ++dev_.dispatch_depth_; }
    ~DispatchScope();
    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;
  private:
    LocalDevice& dev_;
  };

  using ActionFactory = std::function<std::unique_ptr<FeatureAction>()>;

  bool start_or_merge(ActionKind kind, uint8_t target,
                      std::shared_ptr<ControlCallback> cb, const ActionFactory& make);
  void process_one();
  void fire_due_timers();
  void purge_finished();

  transport::BusTransport& bus_;
  DeviceConfig config_;

  std::vector<std::unique_ptr<FeatureAction>> actions_;   // registration order
  ActionTimerQueue timers_;
  etl::deque<CecMessage, INBOX_CAP> inbox_;

  uint32_t next_action_id_{1};
  int      dispatch_depth_{0};
  bool     purge_pending_{false};

  bool     clock_started_{false};
  uint64_t last_ms_{0};
  uint64_t uptime_ms_{0};
  uint64_t tick_count_{0};

  uint8_t  active_logical_{ADDR_UNREGISTERED};
  uint16_t active_physical_{INVALID_PHYSICAL_ADDRESS};
  int      routing_port_{PORT_UNKNOWN};
  int      local_active_port_{PORT_UNKNOWN};
};

} // namespace cecflow

#endif // CECFLOW_LOCAL_DEVICE_HPP
