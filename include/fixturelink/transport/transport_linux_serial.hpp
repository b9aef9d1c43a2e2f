#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (termios raw 8N1, non-blocking fd, poll-timed reads).
 *
 * Depends on: unistd.h, fcntl.h, termios.h, poll.h. Linux-only path.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "fixturelink/transport/transport_base.hpp"
#include <string>

namespace fixturelink::transport {

struct SerialConfig {
  std::string path;          // e.g. /dev/serial/by-id/usb-...
  int baud{9600};
  int boot_delay_ms{0};      // USB CDC boards that reset on open need a pause
  int write_timeout_ms{1000};
};

class LinuxSerial : public ITransport {
public:
  explicit LinuxSerial(SerialConfig cfg) : cfg_(std::move(cfg)) {}
  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool begin() override;
  void end() override;
  bool is_open() const override { return fd_ >= 0; }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override;
  TxResult send(const uint8_t* data, std::size_t len) override;
  void flush_input() override;

  const char* name() const override { return "linux-serial"; }
  const SerialConfig& config() const { return cfg_; }

private:
  SerialConfig cfg_;
  int fd_{-1};
};

} // namespace fixturelink::transport
