// ============================================================================
// transport_udp.cpp — implementation for transport_udp.hpp
// ============================================================================

#include "fixturelink/transport/transport_udp.hpp"

#include <arpa/inet.h>
#include <netdb.h>         // getaddrinfo for host names as well as dotted quads
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace fixturelink::transport {

// ---------------------------------------------------------------------------
// begin()
// -------
// Resolve host (IPv4 only, the bench network is flat), optionally bind a
// fixed local port, then connect() so send()/recv() need no address.
// ---------------------------------------------------------------------------
bool UdpSocket::begin() {
  end();

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo* res = nullptr;
  const std::string port = std::to_string(cfg_.port);
  if (::getaddrinfo(cfg_.host.c_str(), port.c_str(), &hints, &res) != 0 || !res) return false;

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) { ::freeaddrinfo(res); return false; }

  if (cfg_.local_port != 0) {
    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(cfg_.local_port);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof local) != 0) {
      ::freeaddrinfo(res);
      end();
      return false;
    }
  }

  const int rc = ::connect(fd_, res->ai_addr, res->ai_addrlen);
  ::freeaddrinfo(res);
  if (rc != 0) { end(); return false; }
  return true;
}

void UdpSocket::end() {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

RxResult UdpSocket::recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
  out_len = 0;
  if (fd_ < 0 || !out || cap == 0) return RxResult::Error;

  pollfd pfd{fd_, POLLIN, 0};
  int pr = ::poll(&pfd, 1, timeout_ms < 0 ? 0 : timeout_ms);
  if (pr == 0) return RxResult::None;
  if (pr < 0) return errno == EINTR ? RxResult::None : RxResult::Error;
  if (pfd.revents & (POLLERR | POLLNVAL)) {
    // A previous datagram drew ICMP port-unreachable; the socket error is
    // sticky until read. The peer may simply not be up yet.
    int err = 0;
    socklen_t elen = sizeof err;
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen) != 0) return RxResult::Error;
    return err == ECONNREFUSED ? RxResult::None : RxResult::Error;
  }

  // MSG_TRUNC reports the full datagram size; one larger than cap is dropped whole
  ssize_t r = ::recv(fd_, out, cap, MSG_DONTWAIT | MSG_TRUNC);
  if (r > static_cast<ssize_t>(cap)) return RxResult::None;
  if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
  if (r == 0) return RxResult::None;                   // empty datagram
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNREFUSED) return RxResult::None;
  return RxResult::Error;
}

TxResult UdpSocket::send(const uint8_t* data, std::size_t len) {
  if (fd_ < 0 || !data || !len) return TxResult::Error;
  ssize_t w = ::send(fd_, data, len, 0);
  if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return TxResult::Busy;
  if (w < 0 && errno == ECONNREFUSED) return TxResult::Ok;   // stale ICMP from an earlier send
  return (w == static_cast<ssize_t>(len)) ? TxResult::Ok : TxResult::Error;
}

// ---------------------------------------------------------------------------
// flush_input()
// -------------
// Read and drop every datagram already queued on the socket.
// ---------------------------------------------------------------------------
void UdpSocket::flush_input() {
  if (fd_ < 0) return;
  uint8_t scratch[2048];
  for (;;) {
    ssize_t r = ::recv(fd_, scratch, sizeof scratch, MSG_DONTWAIT);
    if (r >= 0) continue;
    if (errno == EINTR || errno == ECONNREFUSED) continue;
    break;
  }
}

} // namespace fixturelink::transport
