#pragma once
/**
 * @file bus_transport.hpp
 * @brief Minimal, engine-agnostic bus interface for cecflow transports.
 *
 * Header-only on purpose. The local device consumes exactly this surface.
 */

#include <functional>
#include "cecflow/cec_constants.hpp"
#include "cecflow/cec_message.hpp"

namespace cecflow::transport {

/// Link-layer outcome for one send. Called once, from inside poll().
using SendCallback = std::function<void(TransportResult)>;

/**
 * @brief Transport trait every bus backend implements.
 *
 * Contract:
 *  - send(msg, done) enqueues and returns at once; never blocks on the bus.
 *    `done` (may be empty) is invoked later from poll(), never from send().
 *  - poll() does non-blocking service work: flush writes, read frames,
 *    deliver completions.
 *  - receive(out) pulls one inbound message collected by poll(); false when none.
 *  - name() is a short identifier for logs.
 *
 * All calls come from the thread that owns the local device.
 */
class BusTransport {
public:
  virtual ~BusTransport() = default;
  virtual void        send(const CecMessage& msg, SendCallback done) = 0;
  virtual void        poll() = 0;
  virtual bool        receive(CecMessage& out) = 0;
  virtual const char* name() const = 0;
};

} // namespace cecflow::transport
