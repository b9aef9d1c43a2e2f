// ============================================================================
// transport_memory.cpp — implementation for transport_memory.hpp
// ============================================================================

#include "fixturelink/transport/transport_memory.hpp"

#include <algorithm>
#include <chrono>

namespace fixturelink::transport {

bool MemoryTransport::begin() {
  std::lock_guard<std::mutex> lk(mu_);
  ++begins_;
  if (fail_begin_) return false;
  open_ = true;
  return true;
}

void MemoryTransport::end() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = false;
  }
  cv_.notify_all();
}

bool MemoryTransport::is_open() const {
  std::lock_guard<std::mutex> lk(mu_);
  return open_;
}

RxResult MemoryTransport::recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
  out_len = 0;
  if (!out || cap == 0) return RxResult::Error;

  std::unique_lock<std::mutex> lk(mu_);
  const auto ready = [this] { return !open_ || fail_recv_ || !inbox_.empty(); };
  cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms), ready);

  if (!open_ || fail_recv_) return RxResult::Error;
  if (inbox_.empty()) return RxResult::None;

  const std::size_t n = std::min({cap, max_chunk_, inbox_.size()});
  std::copy_n(inbox_.begin(), n, out);
  inbox_.erase(inbox_.begin(), inbox_.begin() + static_cast<std::ptrdiff_t>(n));
  out_len = n;
  return RxResult::Ok;
}

// ---------------------------------------------------------------------------
// send()
// ------
// Record, then run the hook without holding the lock so the hook may call
// feed() (or anything else on this instance).
// ---------------------------------------------------------------------------
TxResult MemoryTransport::send(const uint8_t* data, std::size_t len) {
  if (!data || !len) return TxResult::Error;

  WriteHook hook;
  Bytes written(data, data + len);
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!open_ || fail_send_) return TxResult::Error;
    writes_.push_back(written);
    hook = hook_;
  }
  if (hook) hook(*this, written);
  return TxResult::Ok;
}

void MemoryTransport::flush_input() {
  std::lock_guard<std::mutex> lk(mu_);
  inbox_.clear();
  ++flushes_;
}

void MemoryTransport::feed(const Bytes& bytes) { feed(bytes.data(), bytes.size()); }

void MemoryTransport::feed(const uint8_t* data, std::size_t len) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    inbox_.insert(inbox_.end(), data, data + len);
  }
  cv_.notify_all();
}

void MemoryTransport::on_write(WriteHook hook) {
  std::lock_guard<std::mutex> lk(mu_);
  hook_ = std::move(hook);
}

std::vector<MemoryTransport::Bytes> MemoryTransport::writes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return writes_;
}

std::size_t MemoryTransport::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return inbox_.size();
}

std::size_t MemoryTransport::flush_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return flushes_;
}

std::size_t MemoryTransport::begin_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return begins_;
}

void MemoryTransport::set_max_chunk(std::size_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  max_chunk_ = n ? n : 1;
}

void MemoryTransport::fail_begin(bool on) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_begin_ = on;
}

void MemoryTransport::fail_recv(bool on) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    fail_recv_ = on;
  }
  cv_.notify_all();
}

void MemoryTransport::fail_send(bool on) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_send_ = on;
}

} // namespace fixturelink::transport
