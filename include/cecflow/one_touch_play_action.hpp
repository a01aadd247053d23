/**
 * @file one_touch_play_action.hpp
 * @brief OneTouchPlayAction: wake the display, claim active source, poll until it is on.
 *
 * @details
 * ## Sequence
 * ```
 *  start():
 *    [tv]        <Text View On>                (completion watched)
 *    [broadcast] <Active Source> phys
 *    record self as active source, routing port = CEC_SWITCH_HOME
 *    [tv]        <Give Device Power Status>    state WAITING_FOR_REPORT_POWER_STATUS
 *    arm response timeout
 *
 *  <Report Power Status> ON from tv  ──► [broadcast] <Active Source> again,
 *                                        RESULT_SUCCESS, finish
 *  <Report Power Status> other       ──► claimed, keep waiting
 *  timeout                           ──► query again while fewer than
 *                                        power_status_loop_max queries went out,
 *                                        otherwise RESULT_TIMEOUT, finish
 *  <Text View On> not acknowledged   ──► negated transport code, finish
 * ```
 *
 * `<Active Source>` goes out twice: at start, and again once the display
 * reports on.
 */
#pragma once
#include <stdint.h>
#include <memory>
#include "feature_action.hpp"

namespace cecflow {

class OneTouchPlayAction : public FeatureAction {
public:
  static constexpr uint8_t STATE_WAITING_FOR_REPORT_POWER_STATUS = 1;

  static std::unique_ptr<OneTouchPlayAction> create(LocalDevice& device, uint8_t target_address);

  ActionKind kind() const override { return ActionKind::OneTouchPlay; }
  bool start() override;
  bool process_command(const CecMessage& cmd) override;

  /// `<Give Device Power Status>` messages sent so far.
  uint8_t queries_sent() const { return queries_sent_; }

protected:
  void handle_timer_event(uint8_t state) override;

private:
  OneTouchPlayAction(LocalDevice& device, uint8_t target_address);

  void broadcast_active_source();
  void query_power_status();
  void on_wake_sent(TransportResult r);

  uint8_t queries_sent_{0};
};

} // namespace cecflow
