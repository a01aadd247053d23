// ============================================================================
// serial_io.cpp: implementation for serial_io.hpp
// ============================================================================
#include "cecflow/serial_io.hpp"
#include "cecflow/slip.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <cerrno>

namespace cecflow {

// map_baud(): termios speed for a baud integer; false when unsupported.
static bool map_baud(int baud, speed_t& out) {
  switch (baud) {
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default:     return false;
  }
}

// set_raw(): 8N1, no echo, no flow control, reads return at once (VMIN=VTIME=0).
static bool set_raw(int fd, speed_t sp) {
  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) return false;
  ::cfmakeraw(&tio);
  ::cfsetispeed(&tio, sp);
  ::cfsetospeed(&tio, sp);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;
  return ::tcsetattr(fd, TCSANOW, &tio) == 0;
}

int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
  speed_t sp;
  if (!map_baud(baud, sp)) return -1;

  int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) return -1;

  if (!set_raw(fd, sp)) {
    ::close(fd);
    return -1;
  }

  if (boot_delay_ms > 0) ::usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
  ::tcflush(fd, TCIOFLUSH);   // drop boot chatter
  return fd;
}

bool write_frame(int fd, const std::vector<uint8_t>& payload) {
  if (fd < 0) return false;
  std::vector<uint8_t> out;
  slip::encode(payload, out);
  return ::write(fd, out.data(), out.size()) == static_cast<ssize_t>(out.size());
}

bool read_available(int fd, std::vector<uint8_t>& out) {
  if (fd < 0) return false;
  uint8_t chunk[64];
  while (true) {
    ssize_t n = ::read(fd, chunk, sizeof chunk);
    if (n > 0) {
      out.insert(out.end(), chunk, chunk + n);
      continue;
    }
    if (n == 0) return false;                                 // peer closed
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true; // drained
    if (errno == EINTR) continue;
    return false;
  }
}

void close_serial(int fd) {
  if (fd >= 0) ::close(fd);
}

} // namespace cecflow
