// -----------------------------------------------------------------------------
// simulated_bus.cpp: SimulatedBus and SimulatedDisplay
// -----------------------------------------------------------------------------
#include "cecflow/transport/simulated_bus.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/log.hpp"

#include <utility>

namespace cecflow::transport {

// ---------- SimulatedBus ----------

void SimulatedBus::send(const CecMessage& msg, SendCallback done) {
  sent_.push_back(msg);
  pending_.push_back(Pending{msg, std::move(done)});
}

void SimulatedBus::poll() {
  if (!auto_complete_) return;
  // only what was pending on entry; completions may send more
  size_t n = pending_.size();
  while (n-- > 0 && !pending_.empty()) {
    Pending p = std::move(pending_.front());
    pending_.pop_front();
    TransportResult r = outcome(p.msg);
    complete(std::move(p), r);
  }
}

bool SimulatedBus::complete_next(TransportResult r) {
  if (pending_.empty()) return false;
  Pending p = std::move(pending_.front());
  pending_.pop_front();
  complete(std::move(p), r);
  return true;
}

bool SimulatedBus::receive(CecMessage& out) {
  if (rx_.empty()) return false;
  out = rx_.front();
  rx_.pop_front();
  return true;
}

size_t SimulatedBus::count_sent(uint8_t opcode) const {
  size_t n = 0;
  for (const auto& m : sent_) if (m.opcode() == opcode) ++n;
  return n;
}

TransportResult SimulatedBus::outcome(const CecMessage& msg) const {
  auto it = forced_.find(msg.opcode());
  if (it != forced_.end()) return it->second;
  if (msg.is_broadcast()) return TransportResult::Success;
  for (const BusPeer* peer : peers_) {
    if (peer->address() == msg.destination()) return TransportResult::Success;
  }
  return TransportResult::Nack;
}

void SimulatedBus::deliver_to_peers(const CecMessage& msg) {
  std::vector<CecMessage> replies;
  for (BusPeer* peer : peers_) {
    if (msg.is_broadcast() || peer->address() == msg.destination()) {
      peer->on_message(msg, replies);
    }
  }
  for (const auto& r : replies) rx_.push_back(r);
}

void SimulatedBus::complete(Pending p, TransportResult r) {
  // a peer only sees what it acknowledged
  if (r == TransportResult::Success) deliver_to_peers(p.msg);
  if (p.done) p.done(r);
}

// ---------- SimulatedDisplay ----------

void SimulatedDisplay::on_message(const CecMessage& msg, std::vector<CecMessage>& replies) {
  switch (msg.opcode()) {
    case OP_TEXT_VIEW_ON:
    case OP_IMAGE_VIEW_ON:
      if (power_ != POWER_STATUS_ON) {
        power_ = POWER_STATUS_TRANSIENT_TO_ON;
        queries_ = 0;
      }
      break;

    case OP_STANDBY:
      power_ = POWER_STATUS_STANDBY;
      queries_ = 0;
      break;

    case OP_ACTIVE_SOURCE:
      if (msg.params().size() != 2) break;
      active_source_ = static_cast<uint16_t>((msg.params()[0] << 8) | msg.params()[1]);
      break;

    case OP_GIVE_DEVICE_POWER_STATUS:
      if (power_ == POWER_STATUS_TRANSIENT_TO_ON && ++queries_ >= wake_after_) {
        power_ = POWER_STATUS_ON;
      }
      if (!silent_) {
        replies.push_back(build_report_power_status(address_, msg.source(),
                                                    static_cast<uint8_t>(power_)));
      }
      break;

    default:
      break;
  }
}

} // namespace cecflow::transport
