/**
 * @page fl-sync fixturelink Frame Synchronizer
 * @file frame_sync.hpp
 * @brief Recovers frame boundaries from an unframed byte stream.
 *
 * @details
 * STATE MACHINE
 * -------------
 *
 *     SeekingSync --sync match--> ValidatingLength --plausible--> ValidatingChecksum --match--> FrameReady
 *          ^                            |                                |
 *          +------- advance 1 byte -----+--------- advance 1 byte -------+
 *
 * - A header-size sliding window (StreamCursor) holds the bytes under test.
 *   Those bytes have already left the Stream Buffer; the body and footer that
 *   follow are only *peeked* until the checksum matches. A rejected candidate
 *   therefore costs exactly one window byte, and the bytes after it are
 *   scanned again on the next pass.
 * - A length outside [min, max_frame_length] is a false sync, not an error.
 * - Missing bytes are never a failure: next_frame() returns Timeout and keeps
 *   its window and state, so the next call resumes where this one stopped.
 *
 * Rejections are logged at debug level and counted in SyncStats.
 */
#ifndef FIXTURELINK_FRAME_SYNC_HPP
#define FIXTURELINK_FRAME_SYNC_HPP

#include <cstddef>
#include <cstdint>

#include "etl/circular_buffer.h"
#include "fixturelink/cancel.hpp"
#include "fixturelink/errors.hpp"
#include "fixturelink/frame.hpp"
#include "fixturelink/logger.hpp"
#include "fixturelink/stream_buffer.hpp"

namespace fixturelink {

#ifndef FIXTURELINK_MAX_HEADER_SIZE
#define FIXTURELINK_MAX_HEADER_SIZE 32
#endif

enum class SyncState : uint8_t { SeekingSync, ValidatingLength, ValidatingChecksum, FrameReady };

const char* to_string(SyncState s);

/// Sliding window over the last header-size bytes taken from the stream.
class StreamCursor {
public:
  explicit StreamCursor(size_t width = 0) : width_(width) {}

  void   set_width(size_t width) { width_ = width; window_.clear(); }
  size_t width() const { return width_; }
  size_t size() const { return window_.size(); }
  bool   full() const { return window_.size() == width_; }

  /// Append one byte; the caller makes room with advance() first.
  void push(uint8_t b) { window_.push(b); }

  /// Slide forward by one byte (drop the oldest).
  void advance() { if (!window_.empty()) window_.pop(); }

  void clear() { window_.clear(); }

  uint8_t operator[](size_t i) const { return window_[i]; }

  /// Copy the window, oldest first, into @p out (size() bytes).
  void copy_to(uint8_t* out) const;

private:
  size_t width_;
  etl::circular_buffer<uint8_t, FIXTURELINK_MAX_HEADER_SIZE> window_;
};

struct SyncStats {
  uint64_t bytes_scanned{0};
  uint64_t sync_hits{0};
  uint64_t length_rejects{0};
  uint64_t checksum_rejects{0};
  uint64_t frames_accepted{0};

  uint64_t rejects() const { return length_rejects + checksum_rejects; }
};

class FrameSynchronizer {
public:
  /// Throws ConfigError when the layout is unusable (header too large, sync field missing).
  FrameSynchronizer(const FrameFormat& format, const Logger& log);

  /**
   * @brief Pull bytes from @p in until one frame validates.
   * @return Ok with @p out filled, or Timeout / Cancelled / Error with state kept.
   */
  IoStatus next_frame(StreamBuffer& in, Frame& out, Deadline deadline, const CancelToken* cancel = nullptr);

  /// Forget the window and any partial validation.
  void reset();

  SyncState state() const { return state_; }
  const SyncStats& stats() const { return stats_; }
  const FrameFormat& format() const { return fmt_; }

private:
  bool sync_matches() const;
  void reject(const char* why);

  FrameFormat fmt_;
  Logger log_;
  size_t header_size_;
  size_t footer_size_;
  size_t sync_offset_{0};
  Bytes sync_pattern_;

  StreamCursor cursor_;
  SyncState state_{SyncState::SeekingSync};
  HeaderFields pending_;
  uint8_t header_buf_[FIXTURELINK_MAX_HEADER_SIZE]{};
  Bytes tail_;
  SyncStats stats_;
};

} // namespace fixturelink

#endif // FIXTURELINK_FRAME_SYNC_HPP
