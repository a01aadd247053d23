/**
 * @file power_status_action.hpp
 * @brief PowerStatusAction: one `<Give Device Power Status>` round trip.
 *
 * @details
 * Delivers the power status the target reports (POWER_STATUS_ON ..
 * POWER_STATUS_TRANSIENT_TO_STANDBY), or POWER_STATUS_UNKNOWN when the query
 * could not be sent or nobody answered within the response timeout. No
 * retries: callers that need polling use one touch play.
 */
#pragma once
#include <stdint.h>
#include <memory>
#include "feature_action.hpp"

namespace cecflow {

class PowerStatusAction : public FeatureAction {
public:
  static constexpr uint8_t STATE_WAITING_FOR_REPORT_POWER_STATUS = 1;

  static std::unique_ptr<PowerStatusAction> create(LocalDevice& device, uint8_t target_address);

  ActionKind kind() const override { return ActionKind::PowerStatus; }
  bool start() override;
  bool process_command(const CecMessage& cmd) override;

protected:
  void handle_timer_event(uint8_t state) override;

private:
  PowerStatusAction(LocalDevice& device, uint8_t target_address);
  void on_sent(TransportResult r);
};

} // namespace cecflow
