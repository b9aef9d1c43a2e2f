#pragma once
/**
 * @file transport_udp.hpp
 * @brief Connected UDP datagram transport (AF_INET, SOCK_DGRAM, poll-timed reads).
 *
 * The socket is connect()ed to the peer so the kernel drops datagrams from
 * anyone else. Each recv() returns at most one datagram; one larger than the
 * caller's buffer is dropped whole, never cut short. Datagram boundaries
 * carry no meaning above this layer, the Frame Synchronizer re-finds frames in
 * the concatenated stream exactly as on serial.
 */

#if !defined(__linux__)
#  error "transport_udp.hpp is Linux-only."
#endif

#include "fixturelink/transport/transport_base.hpp"
#include <string>

namespace fixturelink::transport {

struct UdpConfig {
  std::string host{"192.168.3.100"};
  uint16_t port{8156};
  uint16_t local_port{0};    // 0 = ephemeral
};

class UdpSocket : public ITransport {
public:
  explicit UdpSocket(UdpConfig cfg) : cfg_(std::move(cfg)) {}
  ~UdpSocket() override { end(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool begin() override;
  void end() override;
  bool is_open() const override { return fd_ >= 0; }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override;
  TxResult send(const uint8_t* data, std::size_t len) override;
  void flush_input() override;

  const char* name() const override { return "udp"; }
  const UdpConfig& config() const { return cfg_; }

private:
  UdpConfig cfg_;
  int fd_{-1};
};

} // namespace fixturelink::transport
