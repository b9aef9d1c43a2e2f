/**
 * @file handshake.hpp
 * @brief Connect-time probe strategies used by the Connection Manager.
 *
 * One attempt is always: flush_stale(), send_probe(), await_ack(deadline).
 * The manager owns the retry count, per-attempt timeout and inter-attempt
 * delay; a strategy only knows how to probe and what counts as an answer.
 *
 * - EchoHandshake: a plaintext literal on a separate transport (the VCU's
 *   UDP connect port). The answer must contain the same bytes.
 * - FrameProbeHandshake: a configured frame on the data link. Any frame that
 *   validates is the answer.
 */
#ifndef FIXTURELINK_HANDSHAKE_HPP
#define FIXTURELINK_HANDSHAKE_HPP

#include <string>

#include "fixturelink/cancel.hpp"
#include "fixturelink/frame_link.hpp"
#include "fixturelink/logger.hpp"
#include "fixturelink/transport/transport_base.hpp"

namespace fixturelink {

class Handshake {
public:
  virtual ~Handshake() = default;

  /// Acquire whatever the probe needs beyond the data link. False = cannot even try.
  virtual bool open() = 0;
  virtual void close() = 0;

  virtual void flush_stale() = 0;
  virtual bool send_probe() = 0;
  virtual bool await_ack(Deadline deadline, const CancelToken* cancel) = 0;

  virtual const char* name() const = 0;
};

class EchoHandshake : public Handshake {
public:
  EchoHandshake(transport::ITransport& transport, std::string literal, const Logger& log);

  bool open() override;
  void close() override;
  void flush_stale() override;
  bool send_probe() override;
  bool await_ack(Deadline deadline, const CancelToken* cancel) override;
  const char* name() const override { return "echo"; }

private:
  transport::ITransport& transport_;
  std::string literal_;
  Logger log_;
};

class FrameProbeHandshake : public Handshake {
public:
  FrameProbeHandshake(FrameLink& link, int32_t format_id, Bytes body, const Logger& log);

  bool open() override { return true; }
  void close() override {}
  void flush_stale() override;
  bool send_probe() override;
  bool await_ack(Deadline deadline, const CancelToken* cancel) override;
  const char* name() const override { return "probe"; }

private:
  FrameLink& link_;
  int32_t format_id_;
  Bytes body_;
  Logger log_;
};

} // namespace fixturelink

#endif // FIXTURELINK_HANDSHAKE_HPP
