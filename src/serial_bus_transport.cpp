// -----------------------------------------------------------------------------
// serial_bus_transport.cpp: SerialBusTransport
//
// Bridge protocol: see include/cecflow/transport/serial_bus_transport.hpp
// -----------------------------------------------------------------------------
#include "cecflow/transport/serial_bus_transport.hpp"
#include "cecflow/serial_io.hpp"
#include "cecflow/message_builder.hpp"
#include "cecflow/log.hpp"

#include <fcntl.h>

namespace cecflow::transport {

SerialBusTransport::~SerialBusTransport() {
  close();
}

bool SerialBusTransport::open(const std::string& dev, int baud, int boot_delay_ms) {
  close();
  fd_ = open_serial(dev, baud, boot_delay_ms);
  if (fd_ < 0) {
    log_error("transport=serial event=open_failed dev=", dev, " baud=", baud);
    return false;
  }
  log_info("transport=serial event=open dev=", dev, " baud=", baud);
  return true;
}

bool SerialBusTransport::adopt(int fd) {
  close();
  if (fd < 0) return false;
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;
  fd_ = fd;
  return true;
}

void SerialBusTransport::close() {
  if (fd_ < 0) return;
  close_serial(fd_);
  fd_ = -1;
  decoder_.reset();
  rx_bytes_.clear();
  // sends that can no longer be answered
  for (auto& p : pending_) p.failed = true;
}

// -----------------------------------------------------------------------------
// send(): write one BRIDGE_TX frame; completion arrives later through poll().
// POLICY:
//   - Never calls `done` directly; a failed write is parked as a failed pending
//     entry so the caller sees the result from poll() like every other one.
//   - A full pending table fails the send the same way.
// -----------------------------------------------------------------------------
void SerialBusTransport::send(const CecMessage& msg, SendCallback done) {
  Pending p;
  p.done = std::move(done);

  if (pending_.size() >= PENDING_CAP) {
    log_warn("transport=serial event=send_refused reason=pending_full ", describe(msg));
    p.failed = true;
    pending_.push_back(std::move(p));
    return;
  }

  std::vector<uint8_t> payload;
  payload.reserve(3 + msg.params().size());
  payload.push_back(BRIDGE_TX);
  std::vector<uint8_t> raw = msg.to_bytes();
  payload.insert(payload.end(), raw.begin(), raw.end());

  if (!write_frame(fd_, payload)) {
    log_warn("transport=serial event=write_failed ", describe(msg));
    p.failed = true;
  }
  pending_.push_back(std::move(p));
}

void SerialBusTransport::poll() {
  // PRE: parked failures first, in order, so they never wait on a status
  flush_failed();

  if (fd_ < 0) return;
  rx_bytes_.clear();
  const bool link_ok = read_available(fd_, rx_bytes_);

  // frames that arrived before the peer went away still count
  std::vector<uint8_t> frame;
  for (uint8_t b : rx_bytes_) {
    if (decoder_.feed(b, frame)) handle_frame(frame);
  }
  if (!link_ok) {
    log_error("transport=serial event=read_failed");
    close();
  }
  flush_failed();
}

// flush_failed(): the bridge never saw these frames, so no status will come.
void SerialBusTransport::flush_failed() {
  while (!pending_.empty() && pending_.front().failed) {
    complete_oldest(TransportResult::Fail);
  }
}

bool SerialBusTransport::receive(CecMessage& out) {
  if (rx_.empty()) return false;
  out = rx_.front();
  rx_.pop_front();
  return true;
}

TransportResult SerialBusTransport::status_to_result(uint8_t status) {
  switch (status) {
    case 0:  return TransportResult::Success;
    case 1:  return TransportResult::Nack;
    case 2:  return TransportResult::Busy;
    default: return TransportResult::Fail;
  }
}

void SerialBusTransport::handle_frame(const std::vector<uint8_t>& frame) {
  const uint8_t type = frame[0];   // decoder never yields empty frames

  if (type == BRIDGE_TX_STATUS) {
    if (frame.size() != 2) {
      log_warn("transport=serial event=bad_frame type=tx_status len=", frame.size());
      return;
    }
    flush_failed();
    if (pending_.empty()) {
      log_warn("transport=serial event=unexpected_status status=", int(frame[1]));
      return;
    }
    complete_oldest(status_to_result(frame[1]));
    return;
  }

  if (type == BRIDGE_RX) {
    CecMessage msg = CecMessage::from_bytes(frame.data() + 1, frame.size() - 1);
    if (rx_.full()) {
      log_warn("transport=serial event=drop reason=rx_full ", describe(msg));
      return;
    }
    rx_.push_back(msg);   // validity is the device's call
    return;
  }

  log_warn("transport=serial event=bad_frame type=", int(type), " len=", frame.size());
}

void SerialBusTransport::complete_oldest(TransportResult r) {
  SendCallback done = std::move(pending_.front().done);
  pending_.erase(pending_.begin());
  if (done) done(r);
}

} // namespace cecflow::transport
