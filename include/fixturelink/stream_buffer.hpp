/**
 * @page fl-stream fixturelink Stream Buffer
 * @file stream_buffer.hpp
 * @brief Thread-safe byte accumulator between a transport and the synchronizer.
 *
 * @details
 * Bytes arrive from the transport in whatever pieces the OS hands over (one
 * byte of a serial frame, a whole UDP datagram). The buffer pulls them in
 * CHUNK-sized reads and lets the consumer look ahead (peek) before committing
 * (read/discard). Nothing leaves the buffer except through read() or
 * discard(), so accepted bytes are consumed exactly once.
 *
 * BLOCKING
 * --------
 * fill/peek/read wait up to an absolute deadline. The transport is polled in
 * slices of at most SLICE_MS so a CancelToken is noticed promptly. A short
 * stream is never an error; it is a Timeout, and whatever did arrive stays
 * buffered for the next call.
 *
 * LOCKING
 * -------
 * Every public call takes one std::recursive_mutex owned by the instance.
 * peek() and read() call fill() with the lock already held, hence recursive,
 * and so hold it for their whole wait. A direct fill() call releases it
 * between slices.
 */
#ifndef FIXTURELINK_STREAM_BUFFER_HPP
#define FIXTURELINK_STREAM_BUFFER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "fixturelink/cancel.hpp"
#include "fixturelink/errors.hpp"
#include "fixturelink/logger.hpp"
#include "fixturelink/message_codec.hpp"
#include "fixturelink/transport/transport_base.hpp"

namespace fixturelink {

class StreamBuffer {
public:
  static constexpr size_t CHUNK = 4096;
  static constexpr int SLICE_MS = 20;

  StreamBuffer(transport::ITransport& transport, const Logger& log);

  StreamBuffer(const StreamBuffer&) = delete;
  StreamBuffer& operator=(const StreamBuffer&) = delete;

  /// Block until size() >= @p min_bytes, the deadline passes, or cancel fires.
  IoStatus fill(size_t min_bytes, Deadline deadline, const CancelToken* cancel = nullptr);

  /// Copy the next @p n bytes without consuming them.
  IoStatus peek(size_t n, Bytes& out, Deadline deadline, const CancelToken* cancel = nullptr);
  IoStatus peek(size_t n, uint8_t* out, Deadline deadline, const CancelToken* cancel = nullptr);

  /// peek() then discard(); @p out is untouched unless the result is Ok.
  IoStatus read(size_t n, Bytes& out, Deadline deadline, const CancelToken* cancel = nullptr);
  IoStatus read(size_t n, uint8_t* out, Deadline deadline, const CancelToken* cancel = nullptr);

  /// Drop up to @p n buffered bytes; returns how many were dropped.
  size_t discard(size_t n);

  size_t size() const;

  /// Drop everything buffered and whatever the transport is already holding.
  void clear();

  /// Total bytes ever pulled from the transport.
  uint64_t bytes_pulled() const;

private:
  transport::ITransport& transport_;
  Logger log_;
  mutable std::recursive_mutex mu_;
  std::deque<uint8_t> buf_;
  std::array<uint8_t, CHUNK> chunk_{};
  uint64_t pulled_{0};
};

} // namespace fixturelink

#endif // FIXTURELINK_STREAM_BUFFER_HPP
