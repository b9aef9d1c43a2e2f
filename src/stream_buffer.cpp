// ============================================================================
// stream_buffer.cpp — implementation for stream_buffer.hpp
// ============================================================================

#include "fixturelink/stream_buffer.hpp"

#include <algorithm>
#include <string>

namespace fixturelink {

StreamBuffer::StreamBuffer(transport::ITransport& transport, const Logger& log)
: transport_(transport), log_(log) {}

// ---------------------------------------------------------------------------
// fill()
// ------
// Each pass: check cancel, poll the transport for at most one slice, append
// whatever came. At least one poll always happens, so a deadline that has
// already passed still picks up bytes that are sitting in the transport.
// ---------------------------------------------------------------------------
IoStatus StreamBuffer::fill(size_t min_bytes, Deadline deadline, const CancelToken* cancel) {
  for (;;) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (buf_.size() >= min_bytes) return IoStatus::Ok;
    if (is_cancelled(cancel)) return IoStatus::Cancelled;

    const long left = ms_until(deadline);
    const int wait = static_cast<int>(std::min<long>(left, SLICE_MS));

    size_t n = 0;
    const transport::RxResult r = transport_.recv(chunk_.data(), chunk_.size(), n, wait);
    if (r == transport::RxResult::Error) {
      log_.warn(std::string("transport ") + transport_.name() + " read failed");
      return IoStatus::Error;
    }
    if (r == transport::RxResult::Ok && n > 0) {
      buf_.insert(buf_.end(), chunk_.begin(), chunk_.begin() + static_cast<std::ptrdiff_t>(n));
      pulled_ += n;
      continue;
    }
    if (left == 0) return IoStatus::Timeout;
  }
}

IoStatus StreamBuffer::peek(size_t n, uint8_t* out, Deadline deadline, const CancelToken* cancel) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  const IoStatus st = fill(n, deadline, cancel);
  if (st != IoStatus::Ok) return st;
  std::copy_n(buf_.begin(), n, out);
  return IoStatus::Ok;
}

IoStatus StreamBuffer::peek(size_t n, Bytes& out, Deadline deadline, const CancelToken* cancel) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  const IoStatus st = fill(n, deadline, cancel);
  if (st != IoStatus::Ok) return st;
  out.assign(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(n));
  return IoStatus::Ok;
}

IoStatus StreamBuffer::read(size_t n, uint8_t* out, Deadline deadline, const CancelToken* cancel) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  const IoStatus st = peek(n, out, deadline, cancel);
  if (st == IoStatus::Ok) discard(n);
  return st;
}

IoStatus StreamBuffer::read(size_t n, Bytes& out, Deadline deadline, const CancelToken* cancel) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  const IoStatus st = peek(n, out, deadline, cancel);
  if (st == IoStatus::Ok) discard(n);
  return st;
}

size_t StreamBuffer::discard(size_t n) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  const size_t k = std::min(n, buf_.size());
  buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(k));
  return k;
}

size_t StreamBuffer::size() const {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  return buf_.size();
}

void StreamBuffer::clear() {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  if (!buf_.empty()) log_.debug("dropping " + std::to_string(buf_.size()) + " buffered bytes");
  buf_.clear();
  if (transport_.is_open()) transport_.flush_input();
}

uint64_t StreamBuffer::bytes_pulled() const {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  return pulled_;
}

} // namespace fixturelink
