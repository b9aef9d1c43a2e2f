#pragma once
/**
 * @file transport_memory.hpp
 * @brief In-process transport for tests and loopback benches.
 *
 * Inbound bytes are queued with feed(); recv() hands them out at most
 * `max_chunk` at a time, so partial reads can be forced down to one byte per
 * call. Every send() is recorded and passed to an optional write hook, which
 * is how a test plays the device on the other end (feed a reply from inside
 * the hook). Failures can be injected per direction.
 *
 * Thread-safe: the reader thread, the control loop and the test body may all
 * touch one instance.
 */

#include "fixturelink/transport/transport_base.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace fixturelink::transport {

class MemoryTransport : public ITransport {
public:
  using Bytes = std::vector<uint8_t>;
  using WriteHook = std::function<void(MemoryTransport& self, const Bytes& written)>;

  explicit MemoryTransport(std::size_t max_chunk = 4096) : max_chunk_(max_chunk ? max_chunk : 1) {}

  bool begin() override;
  void end() override;
  bool is_open() const override;

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override;
  TxResult send(const uint8_t* data, std::size_t len) override;
  void flush_input() override;

  const char* name() const override { return "memory"; }

  // --- peer side -----------------------------------------------------------
  void feed(const Bytes& bytes);
  void feed(const uint8_t* data, std::size_t len);
  void on_write(WriteHook hook);

  // --- inspection / fault injection ---------------------------------------
  std::vector<Bytes> writes() const;
  std::size_t pending() const;
  std::size_t flush_count() const;
  std::size_t begin_count() const;
  void set_max_chunk(std::size_t n);
  void fail_begin(bool on);
  void fail_recv(bool on);
  void fail_send(bool on);

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<uint8_t> inbox_;
  std::vector<Bytes> writes_;
  WriteHook hook_;
  std::size_t max_chunk_;
  std::size_t flushes_{0};
  std::size_t begins_{0};
  bool open_{false};
  bool fail_begin_{false};
  bool fail_recv_{false};
  bool fail_send_{false};
};

} // namespace fixturelink::transport
