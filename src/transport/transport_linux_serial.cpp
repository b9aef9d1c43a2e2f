// ============================================================================
// transport_linux_serial.cpp — implementation for transport_linux_serial.hpp
// ============================================================================

#include "fixturelink/transport/transport_linux_serial.hpp"

#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based reads and writes
#include <cerrno>

namespace fixturelink::transport {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given baud.
// - Disables echo, line buffering, and flow control (8N1 raw mode).
// - Sets VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
// - Flushes both input/output buffers after applying settings.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) return false;

  ::cfmakeraw(&tio);
  ::cfsetispeed(&tio, baud);
  ::cfsetospeed(&tio, baud);

  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  if (::tcsetattr(fd, TCSANOW, &tio) != 0) return false;
  ::tcflush(fd, TCIOFLUSH);
  return true;
}

static bool baud_constant(int baud, speed_t& out) {
  switch (baud) {
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
#ifdef B230400
    case 230400: out = B230400; return true;
#endif
#ifdef B460800
    case 460800: out = B460800; return true;
#endif
    default: return false;
  }
}

bool LinuxSerial::begin() {
  end();
  if (cfg_.path.empty()) return false;

  speed_t sp = B9600;
  if (!baud_constant(cfg_.baud, sp)) return false;   // an unsupported rate is a config bug, not a fallback

  fd_ = ::open(cfg_.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) return false;

  if (!set_raw(fd_, sp)) { end(); return false; }

  if (cfg_.boot_delay_ms > 0) {
    ::usleep(static_cast<useconds_t>(cfg_.boot_delay_ms) * 1000);
    ::tcflush(fd_, TCIOFLUSH);                        // boot chatter
  }
  return true;
}

void LinuxSerial::end() {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

// ---------------------------------------------------------------------------
// recv()
// ------
// One poll() bounded by timeout_ms, then one non-blocking read of up to cap
// bytes. A hangup (USB unplugged) surfaces as Error so the connection manager
// can fault the channel instead of spinning on timeouts.
// ---------------------------------------------------------------------------
RxResult LinuxSerial::recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
  out_len = 0;
  if (fd_ < 0 || !out || cap == 0) return RxResult::Error;

  pollfd pfd{fd_, POLLIN, 0};
  int pr = ::poll(&pfd, 1, timeout_ms < 0 ? 0 : timeout_ms);
  if (pr == 0) return RxResult::None;
  if (pr < 0) return errno == EINTR ? RxResult::None : RxResult::Error;
  if (pfd.revents & (POLLERR | POLLNVAL)) return RxResult::Error;
  if (!(pfd.revents & POLLIN) && (pfd.revents & POLLHUP)) return RxResult::Error;

  ssize_t r = ::read(fd_, out, cap);
  if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
  if (r == 0 || errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
  return RxResult::Error;
}

TxResult LinuxSerial::send(const uint8_t* data, std::size_t len) {
  if (fd_ < 0 || !data || !len) return TxResult::Error;

  std::size_t sent = 0;
  while (sent < len) {
    ssize_t w = ::write(fd_, data + sent, len - sent);
    if (w > 0) { sent += static_cast<std::size_t>(w); continue; }
    if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return TxResult::Error;

    pollfd pfd{fd_, POLLOUT, 0};
    int pr = ::poll(&pfd, 1, cfg_.write_timeout_ms);
    if (pr == 0) return TxResult::Busy;
    if (pr < 0 && errno != EINTR) return TxResult::Error;
  }
  return TxResult::Ok;
}

void LinuxSerial::flush_input() {
  if (fd_ >= 0) ::tcflush(fd_, TCIFLUSH);
}

} // namespace fixturelink::transport
