// ============================================================================
// frame_sync.cpp — implementation for frame_sync.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "fixturelink/frame_sync.hpp"

#include <string>

namespace fixturelink {

const char* to_string(SyncState s) {
  switch (s) {
    case SyncState::SeekingSync:        return "seeking_sync";
    case SyncState::ValidatingLength:   return "validating_length";
    case SyncState::ValidatingChecksum: return "validating_checksum";
    case SyncState::FrameReady:         return "frame_ready";
  }
  return "unknown";
}

void StreamCursor::copy_to(uint8_t* out) const {
  for (size_t i = 0; i < window_.size(); ++i) out[i] = window_[i];
}

// ---------------------------------------------------------------------------
// Construction
// ------------
// Precompute the sync marker's wire bytes and where they sit in the header so
// the hot path compares raw bytes and only decodes a header on a hit.
// ---------------------------------------------------------------------------
FrameSynchronizer::FrameSynchronizer(const FrameFormat& format, const Logger& log)
: fmt_(format), log_(log),
  header_size_(format.layout.header_size()),
  footer_size_(format.layout.footer_size()) {
  const FrameLayout& L = fmt_.layout;
  const std::string name = L.header.name.c_str();

  if (header_size_ == 0 || header_size_ > FIXTURELINK_MAX_HEADER_SIZE)
    throw ConfigError(name + ": header size " + std::to_string(header_size_) + " unsupported");
  if (L.sync_field < 0 || static_cast<size_t>(L.sync_field) >= L.header.fields.size())
    throw ConfigError(name + ": no sync field");
  if (L.length_field < 0 || static_cast<size_t>(L.length_field) >= L.header.fields.size())
    throw ConfigError(name + ": no length field");
  if (L.checksum_field < 0 && L.footer_checksum_field < 0)
    throw ConfigError(name + ": checksum field missing from both header and footer");

  for (int i = 0; i < L.sync_field; ++i) sync_offset_ += field_width(L.header.fields[i].kind);

  const MessageDescriptor sync_only = make_descriptor("sync", 0, {L.header.fields[L.sync_field]});
  try {
    sync_pattern_ = encode(sync_only, {uint64_t{fmt_.sync_value}});
  } catch (const EncodingError& e) {
    throw ConfigError(name + ": sync value does not fit its field (" + e.what() + ")");
  }

  cursor_.set_width(header_size_);
}

void FrameSynchronizer::reset() {
  cursor_.clear();
  tail_.clear();
  state_ = SyncState::SeekingSync;
}

bool FrameSynchronizer::sync_matches() const {
  for (size_t i = 0; i < sync_pattern_.size(); ++i) {
    if (cursor_[sync_offset_ + i] != sync_pattern_[i]) return false;
  }
  return true;
}

void FrameSynchronizer::reject(const char* why) {
  if (log_.enabled(Logger::Level::Debug)) {
    log_.debug(std::string("false sync: ") + why + " length=" + std::to_string(pending_.length) +
               " after " + std::to_string(stats_.bytes_scanned) + " bytes");
  }
  cursor_.advance();
  state_ = SyncState::SeekingSync;
}

// ---------------------------------------------------------------------------
// next_frame()
// ------------
// Runs the state machine until a frame validates or the stream runs dry.
// Returning early (Timeout/Cancelled/Error) leaves cursor_ and state_ as they
// are; ValidatingChecksum resumes by peeking the same body again.
// ---------------------------------------------------------------------------
IoStatus FrameSynchronizer::next_frame(StreamBuffer& in, Frame& out, Deadline deadline, const CancelToken* cancel) {
  if (state_ == SyncState::FrameReady) state_ = SyncState::SeekingSync;

  for (;;) {
    switch (state_) {
      case SyncState::SeekingSync: {
        while (!cursor_.full()) {
          uint8_t b = 0;
          const IoStatus st = in.read(1, &b, deadline, cancel);
          if (st != IoStatus::Ok) return st;
          cursor_.push(b);
          ++stats_.bytes_scanned;
        }
        if (!sync_matches()) {
          cursor_.advance();
          break;
        }
        ++stats_.sync_hits;
        state_ = SyncState::ValidatingLength;
        break;
      }

      case SyncState::ValidatingLength: {
        cursor_.copy_to(header_buf_);
        pending_ = read_header(fmt_.layout, header_buf_);
        if (!length_plausible(fmt_, pending_.length)) {
          ++stats_.length_rejects;
          reject("length out of range");
          break;
        }
        state_ = SyncState::ValidatingChecksum;
        break;
      }

      case SyncState::ValidatingChecksum: {
        const size_t body_len = body_length(fmt_.layout, pending_.length);
        const IoStatus st = in.peek(body_len + footer_size_, tail_, deadline, cancel);
        if (st != IoStatus::Ok) return st;

        const uint8_t* body = tail_.data();
        const uint32_t expected = fmt_.layout.checksum_field >= 0
                                      ? pending_.checksum
                                      : read_footer_checksum(fmt_.layout, body + body_len);
        const ByteRanges ranges = checksum_ranges(fmt_.checksum, header_buf_, header_size_, body, body_len);
        if (!verify(fmt_.checksum.algorithm, ranges, expected)) {
          ++stats_.checksum_rejects;
          reject("checksum mismatch");
          break;
        }

        in.discard(body_len + footer_size_);

        out.sync      = pending_.sync;
        out.length    = pending_.length;
        out.checksum  = expected;
        out.format_id = pending_.format_id;
        out.reserved  = pending_.reserved;
        out.header.assign(header_buf_, header_buf_ + header_size_);
        out.body.assign(tail_.begin(), tail_.begin() + static_cast<std::ptrdiff_t>(body_len));
        out.footer.assign(tail_.begin() + static_cast<std::ptrdiff_t>(body_len), tail_.end());

        cursor_.clear();
        ++stats_.frames_accepted;
        state_ = SyncState::FrameReady;
        return IoStatus::Ok;
      }

      case SyncState::FrameReady:
        state_ = SyncState::SeekingSync;
        break;
    }
  }
}

} // namespace fixturelink
