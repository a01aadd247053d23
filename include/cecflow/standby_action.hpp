/**
 * @file standby_action.hpp
 * @brief StandbyAction: send `<Standby>` and wait a bounded time for a link failure.
 *
 * @details
 * `<Standby>` has no reply opcode. The only thing worth waiting for is the
 * link layer telling us the target did not take it. A successful send
 * therefore changes nothing; the action ends either on a failed send
 * (negated transport code) or when its single timeout runs out
 * (RESULT_NO_ACK).
 */
#pragma once
#include <stdint.h>
#include <memory>
#include "feature_action.hpp"

namespace cecflow {

class StandbyAction : public FeatureAction {
public:
  static constexpr uint8_t STATE_WAITING_FOR_ACK = 1;

  static std::unique_ptr<StandbyAction> create(LocalDevice& device, uint8_t target_address);

  ActionKind kind() const override { return ActionKind::Standby; }
  bool start() override;
  bool process_command(const CecMessage&) override { return false; }

protected:
  void handle_timer_event(uint8_t state) override;

private:
  StandbyAction(LocalDevice& device, uint8_t target_address);
  void on_sent(TransportResult r);
};

} // namespace cecflow
