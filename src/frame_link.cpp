// ============================================================================
// frame_link.cpp — implementation for frame_link.hpp
// ============================================================================

#include "fixturelink/frame_link.hpp"

#include <string>

namespace fixturelink {

FrameLink::FrameLink(transport::ITransport& transport, const FrameFormat& format, const Logger& log)
: transport_(transport),
  log_(log),
  buffer_(transport, log.child(log.component() + ":buf")),
  sync_(format, log.child(log.component() + ":sync")) {}

LinkStatus FrameLink::write_frame(int32_t format_id, const Bytes& body) {
  const Bytes wire = build_frame(sync_.format(), format_id, body);

  std::lock_guard<std::mutex> lk(send_mu_);
  const transport::TxResult r = transport_.send(wire.data(), wire.size());
  if (r != transport::TxResult::Ok) {
    log_.warn(std::string("send of ") + std::to_string(wire.size()) + " bytes failed: " + transport::to_string(r));
    return LinkStatus::IoError;
  }
  if (log_.enabled(Logger::Level::Debug))
    log_.debug("sent format=" + std::to_string(format_id) + " bytes=" + std::to_string(wire.size()));
  return LinkStatus::Ok;
}

IoStatus FrameLink::read_frame(Frame& out, Deadline deadline, const CancelToken* cancel) {
  return sync_.next_frame(buffer_, out, deadline, cancel);
}

void FrameLink::reset() {
  buffer_.clear();
  sync_.reset();
}

} // namespace fixturelink
