#pragma once
/**
 * @file simulated_bus.hpp
 * @brief In-memory bus and a model display, for tests and `cecflow-cli --simulate`.
 *
 * SimulatedBus keeps every message the local device sends, holds their
 * completions until poll(), and lets attached peers acknowledge and answer.
 *
 * Acknowledgement model:
 *  - broadcast: always Success.
 *  - directed:  Success when an attached peer owns the destination address,
 *               Nack otherwise.
 *  - `set_send_result(opcode, r)` overrides the outcome for one opcode.
 *
 * Replies produced by peers for an acknowledged message are queued for
 * receive() during the same poll() that completes the send.
 *
 * With `set_auto_complete(false)` poll() leaves sends pending; tests then
 * drive each completion with `complete_next(r)`.
 */

#include <stdint.h>
#include <stddef.h>
#include <deque>
#include <map>
#include <vector>
#include "cecflow/transport/bus_transport.hpp"

namespace cecflow::transport {

/// Something on the simulated bus besides the local device.
class BusPeer {
public:
  virtual ~BusPeer() = default;
  virtual uint8_t address() const = 0;
  /// Called for every acknowledged message addressed to this peer or broadcast.
  virtual void on_message(const CecMessage& msg, std::vector<CecMessage>& replies) = 0;
};

class SimulatedBus : public BusTransport {
public:
  void        send(const CecMessage& msg, SendCallback done) override;
  void        poll() override;
  bool        receive(CecMessage& out) override;
  const char* name() const override { return "simulated"; }

  /// Peer must outlive the bus.
  void attach(BusPeer& peer) { peers_.push_back(&peer); }

  void set_auto_complete(bool on) { auto_complete_ = on; }
  void set_send_result(uint8_t opcode, TransportResult r) { forced_[opcode] = r; }
  void clear_send_results() { forced_.clear(); }

  /// Complete the oldest pending send with `r`. False when nothing is pending.
  bool complete_next(TransportResult r);

  /// Queue a message as if another device had sent it.
  void inject(const CecMessage& msg) { rx_.push_back(msg); }

  const std::vector<CecMessage>& sent() const { return sent_; }
  size_t count_sent(uint8_t opcode) const;
  void   clear_sent() { sent_.clear(); }
  size_t pending_count() const { return pending_.size(); }

private:
  struct Pending {
    CecMessage   msg;
    SendCallback done;
  };

  TransportResult outcome(const CecMessage& msg) const;
  void deliver_to_peers(const CecMessage& msg);
  void complete(Pending p, TransportResult r);

  std::vector<BusPeer*>   peers_;
  std::vector<CecMessage> sent_;
  std::deque<Pending>     pending_;
  std::deque<CecMessage>  rx_;
  std::map<uint8_t, TransportResult> forced_;
  bool auto_complete_{true};
};

/**
 * @brief A display at ADDR_TV (by default) that wakes slowly.
 *
 * - Starts in standby.
 * - `<Text View On>` / `<Image View On>`: starts waking.
 * - `<Give Device Power Status>`: replies STANDBY while asleep; while waking,
 *   TRANSIENT_TO_ON until the `wake_after`-th query since the wake command,
 *   then ON from that query on.
 * - `<Standby>`: back to standby.
 * - Silent: still acknowledges, never replies.
 */
class SimulatedDisplay : public BusPeer {
public:
  explicit SimulatedDisplay(uint8_t address = ADDR_TV) : address_(address) {}

  uint8_t address() const override { return address_; }
  void on_message(const CecMessage& msg, std::vector<CecMessage>& replies) override;

  void set_wake_after(unsigned queries) { wake_after_ = queries ? queries : 1; }
  void set_silent(bool silent) { silent_ = silent; }

  int      power_status() const { return power_; }
  unsigned queries() const      { return queries_; }
  uint16_t active_source() const { return active_source_; }

private:
  uint8_t  address_;
  unsigned wake_after_{1};
  bool     silent_{false};
  int      power_{POWER_STATUS_STANDBY};
  unsigned queries_{0};       // since the last wake command
  uint16_t active_source_{INVALID_PHYSICAL_ADDRESS};
};

} // namespace cecflow::transport
