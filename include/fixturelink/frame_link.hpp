/**
 * @file frame_link.hpp
 * @brief One data transport + its Stream Buffer + Frame Synchronizer, as a frame pipe.
 *
 * write_frame() builds and sends one frame under a send lock (one writer per
 * transport). read_frame() runs the synchronizer against the buffer. Reads
 * are single-consumer: the handshake uses them while Connecting, the reader
 * thread once Connected, never both.
 */
#ifndef FIXTURELINK_FRAME_LINK_HPP
#define FIXTURELINK_FRAME_LINK_HPP

#include <mutex>

#include "fixturelink/cancel.hpp"
#include "fixturelink/errors.hpp"
#include "fixturelink/frame.hpp"
#include "fixturelink/frame_sync.hpp"
#include "fixturelink/logger.hpp"
#include "fixturelink/stream_buffer.hpp"
#include "fixturelink/transport/transport_base.hpp"

namespace fixturelink {

class FrameLink {
public:
  FrameLink(transport::ITransport& transport, const FrameFormat& format, const Logger& log);

  /// Ok, or IoError when the transport refused the bytes. Throws EncodingError for an unframeable body.
  LinkStatus write_frame(int32_t format_id, const Bytes& body);

  IoStatus read_frame(Frame& out, Deadline deadline, const CancelToken* cancel = nullptr);

  /// Drop buffered and pending inbound bytes and restart synchronization.
  void reset();

  transport::ITransport& transport() { return transport_; }
  const FrameSynchronizer& synchronizer() const { return sync_; }
  StreamBuffer& buffer() { return buffer_; }

private:
  transport::ITransport& transport_;
  Logger log_;
  StreamBuffer buffer_;
  FrameSynchronizer sync_;
  std::mutex send_mu_;
};

} // namespace fixturelink

#endif // FIXTURELINK_FRAME_LINK_HPP
