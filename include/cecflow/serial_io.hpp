/**
 * @page cf-serial-io cecflow Serial I/O
 * @file serial_io.hpp
 * @brief Raw-mode TTY helpers used by the serial bridge transport.
 *
 * @details
 * PURPOSE
 * -------
 * Open a USB CDC / UART bridge, write SLIP frames to it, and pull whatever
 * bytes are waiting without blocking. Timing belongs to the local device's
 * tick loop, so nothing here waits except the boot delay in open_serial().
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Prefer /dev/serial/by-id/... paths; ttyACM numbers move between boots.
 * - The runtime user needs access to the device (dialout group).
 * - Opening a CDC ACM port resets most bridges; `boot_delay_ms` waits that
 *   out and the input buffer is flushed afterwards.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = cecflow::open_serial("/dev/ttyACM0", 115200, 400);
 *   if (fd < 0) { ... }
 *   cecflow::write_frame(fd, payload);
 *   std::vector<uint8_t> bytes;
 *   cecflow::read_available(fd, bytes);   // feed into a slip::Decoder
 *   cecflow::close_serial(fd);
 * @endcode
 */
#pragma once
#include <stdint.h>
#include <string>
#include <vector>

namespace cecflow {

/**
 * @brief Open `dev` non-blocking in raw 8N1 mode.
 *
 * Supported baud rates: 9600, 19200, 38400, 57600, 115200, 230400. Anything
 * else is refused.
 *
 * @return File descriptor, or -1 (open, termios or baud failure).
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/// SLIP-encode `payload` and write it in one call. False on error or short write.
bool write_frame(int fd, const std::vector<uint8_t>& payload);

/**
 * @brief Append every byte currently readable on `fd` to `out`.
 * @return false on a read error or end of stream; true otherwise (also when nothing was waiting).
 */
bool read_available(int fd, std::vector<uint8_t>& out);

/// Close `fd` when non-negative.
void close_serial(int fd);

} // namespace cecflow
