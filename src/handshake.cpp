// ============================================================================
// handshake.cpp — implementation for handshake.hpp
// ============================================================================

#include "fixturelink/handshake.hpp"
#include "fixturelink/stream_buffer.hpp"

#include <algorithm>
#include <array>

namespace fixturelink {

// ---------------------------------------------------------------------------
// EchoHandshake
// ---------------------------------------------------------------------------
EchoHandshake::EchoHandshake(transport::ITransport& transport, std::string literal, const Logger& log)
: transport_(transport), literal_(std::move(literal)), log_(log) {}

bool EchoHandshake::open() {
  if (transport_.is_open()) return true;
  return transport_.begin();
}

void EchoHandshake::close() { transport_.end(); }

void EchoHandshake::flush_stale() { transport_.flush_input(); }

bool EchoHandshake::send_probe() {
  const auto* p = reinterpret_cast<const uint8_t*>(literal_.data());
  const transport::TxResult r = transport_.send(p, literal_.size());
  if (r != transport::TxResult::Ok) {
    log_.warn(std::string("probe send failed: ") + transport::to_string(r));
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// await_ack()
// -----------
// Collect whatever arrives until the deadline and look for the literal in it.
// Serial-style transports may split the echo across reads, so bytes are
// accumulated rather than compared per read.
// ---------------------------------------------------------------------------
bool EchoHandshake::await_ack(Deadline deadline, const CancelToken* cancel) {
  std::string seen;
  std::array<uint8_t, 256> chunk{};
  for (;;) {
    if (is_cancelled(cancel)) return false;
    const long left = ms_until(deadline);
    const int wait = static_cast<int>(std::min<long>(left, StreamBuffer::SLICE_MS));

    size_t n = 0;
    const transport::RxResult r = transport_.recv(chunk.data(), chunk.size(), n, wait);
    if (r == transport::RxResult::Error) {
      log_.warn("handshake transport read failed");
      return false;
    }
    if (r == transport::RxResult::Ok) {
      seen.append(reinterpret_cast<const char*>(chunk.data()), n);
      if (seen.find(literal_) != std::string::npos) return true;
      continue;
    }
    if (left == 0) return false;
  }
}

// ---------------------------------------------------------------------------
// FrameProbeHandshake
// ---------------------------------------------------------------------------
FrameProbeHandshake::FrameProbeHandshake(FrameLink& link, int32_t format_id, Bytes body, const Logger& log)
: link_(link), format_id_(format_id), body_(std::move(body)), log_(log) {}

void FrameProbeHandshake::flush_stale() { link_.reset(); }

bool FrameProbeHandshake::send_probe() {
  return link_.write_frame(format_id_, body_) == LinkStatus::Ok;
}

bool FrameProbeHandshake::await_ack(Deadline deadline, const CancelToken* cancel) {
  Frame reply;
  const IoStatus st = link_.read_frame(reply, deadline, cancel);
  if (st == IoStatus::Ok) {
    log_.debug("probe answered with format=" + std::to_string(reply.format_id));
    return true;
  }
  return false;
}

} // namespace fixturelink
