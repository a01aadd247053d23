#pragma once
/**
 * @file serial_bus_transport.hpp
 * @brief BusTransport over a serial CEC bridge (SLIP frames on a TTY).
 *
 * Bridge protocol, one SLIP frame each:
 * ```
 *   host -> bridge  [BRIDGE_TX, header, opcode, params...]   send one message
 *   bridge -> host  [BRIDGE_TX_STATUS, status]               result of the oldest send
 *                      status 0 = acked, 1 = nack, 2 = busy, anything else = fail
 *   bridge -> host  [BRIDGE_RX, header, opcode, params...]   message seen on the bus
 * ```
 * The bridge answers sends strictly in order, so statuses complete pending
 * sends first-in first-out. A send whose frame could not be written completes
 * with `Fail` on the next poll().
 *
 * Linux only (termios).
 */

#if !defined(__linux__)
#  error "serial_bus_transport.hpp is Linux-only."
#endif

#include <stdint.h>
#include <string>
#include <vector>
#include "etl/deque.h"
#include "cecflow/slip.hpp"
#include "cecflow/transport/bus_transport.hpp"

namespace cecflow::transport {

class SerialBusTransport : public BusTransport {
public:
  static constexpr uint8_t BRIDGE_TX        = 0x01;
  static constexpr uint8_t BRIDGE_TX_STATUS = 0x02;
  static constexpr uint8_t BRIDGE_RX        = 0x03;

  static constexpr size_t PENDING_CAP = 16;  ///< sends awaiting a status
  static constexpr size_t RX_CAP      = 16;  ///< received messages not yet pulled

  SerialBusTransport() = default;
  ~SerialBusTransport() override;

  SerialBusTransport(const SerialBusTransport&) = delete;
  SerialBusTransport& operator=(const SerialBusTransport&) = delete;

  /// Open the bridge TTY. False when the device cannot be opened or configured.
  bool open(const std::string& dev, int baud, int boot_delay_ms);

  /// Take over an already open descriptor (pipes and socket pairs in tests).
  bool adopt(int fd);

  void close();
  bool is_open() const { return fd_ >= 0; }

  void        send(const CecMessage& msg, SendCallback done) override;
  void        poll() override;
  bool        receive(CecMessage& out) override;
  const char* name() const override { return "serial"; }

  size_t pending_count() const { return pending_.size(); }

  /// Map a bridge status byte to a transport result.
  static TransportResult status_to_result(uint8_t status);

private:
  struct Pending {
    SendCallback    done;
    bool            failed{false};   // write failed: complete with Fail on next poll
  };

  void handle_frame(const std::vector<uint8_t>& frame);
  void complete_oldest(TransportResult r);
  void flush_failed();

  int fd_{-1};
  slip::Decoder decoder_;
  std::vector<uint8_t> rx_bytes_;
  std::vector<Pending> pending_;
  etl::deque<CecMessage, RX_CAP> rx_;
};

} // namespace cecflow::transport
