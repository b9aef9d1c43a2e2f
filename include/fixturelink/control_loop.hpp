/**
 * @page fl-control fixturelink Control Loop
 * @file control_loop.hpp
 * @brief Periodic request/telemetry loop on its own thread, bound to one Connected channel.
 *
 * @details
 * TICK
 * ----
 * 1. Stop if cancelled.
 * 2. Build a request with the next sequence number and the milliseconds
 *    since the loop started.
 * 3. exchange() it, waiting at most tick_deadline_ms.
 * 4. Extract one telemetry scalar from the reply and push it into the
 *    moving-average window.
 * 5. Once the window is full, compare the average with the target. The
 *    first time it is within tolerance, on_reached_target fires. It stays
 *    latched until set_target() is called.
 * 6. Sleep out the rest of period_ms.
 *
 * A missed reply (timeout, or a reply the extractor cannot read) skips the
 * tick and leaves the window alone. More than max_consecutive_failures in a
 * row fault the channel and stop the loop.
 *
 * LATE REPLIES
 * ------------
 * A reply that misses its own tick may still arrive during a later one. With
 * a ReplyMatcher, frames that do not answer the current sequence number are
 * dropped and the tick keeps waiting until its deadline. Without one, the
 * first frame after the request is taken as its reply.
 *
 * STOPPING
 * --------
 * cancel() interrupts the sleep and any in-flight wait. Whatever ends the
 * loop, on_stopped(reason) is called exactly once, from the loop thread,
 * after the channel's control-loop slot has been released.
 *
 * Callbacks run on the loop thread and must not call join() on this loop.
 */
#ifndef FIXTURELINK_CONTROL_LOOP_HPP
#define FIXTURELINK_CONTROL_LOOP_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "fixturelink/cancel.hpp"
#include "fixturelink/connection.hpp"
#include "fixturelink/logger.hpp"
#include "fixturelink/moving_average.hpp"

namespace fixturelink {

struct ControlLoopConfig {
  int      period_ms{100};
  int      tick_deadline_ms{100};
  size_t   window_size{5};
  double   target{0.0};
  double   tolerance{0.0};
  int      max_consecutive_failures{3};
  int32_t  request_format_id{0};
};

enum class StopReason : uint8_t {
  Cancelled,      ///< cancel() or destruction
  Faulted,        ///< too many consecutive failures; the loop faulted the channel
  ChannelLost,    ///< the channel left Connected under the loop
  Error,          ///< a callback threw
};

const char* to_string(StopReason r);

class ControlLoop {
public:
  using RequestBuilder  = std::function<Bytes(uint32_t seq, uint32_t timestamp_ms)>;
  using Telemetry       = std::function<std::optional<double>(const Frame& reply)>;
  using ReachedHandler  = std::function<void(double average)>;
  using StoppedHandler  = std::function<void(StopReason reason)>;
  using ReplyMatcher    = std::function<bool(const Frame& reply, uint32_t seq)>;

  /// Throws ConfigError for a bad window size or non-positive period/deadline.
  ControlLoop(ConnectionManager& channel, const ControlLoopConfig& cfg, const Logger& log);

  /// Cancels and joins.
  ~ControlLoop();

  ControlLoop(const ControlLoop&) = delete;
  ControlLoop& operator=(const ControlLoop&) = delete;

  void on_reached_target(ReachedHandler h) { reached_cb_ = std::move(h); }
  void on_stopped(StoppedHandler h) { stopped_cb_ = std::move(h); }

  /**
   * @brief Launch the loop thread.
   * @return false (and no thread, no on_stopped) when the channel is not
   *         Connected, another loop owns it, or this loop already ran.
   */
  bool start(RequestBuilder build, Telemetry extract, ReplyMatcher match = nullptr);

  void cancel();
  void join();

  /// Wait for the loop to finish; false if it is still running after @p timeout_ms.
  bool wait_stopped(int timeout_ms);

  /// New target; re-arms the reached-target latch.
  void set_target(double target, double tolerance);

  bool running() const { return running_.load(); }
  bool reached() const { return latched_.load(); }
  uint32_t ticks() const { return ticks_.load(); }
  uint32_t consecutive_failures() const { return failures_.load(); }
  std::optional<double> average() const;

private:
  void run(RequestBuilder build, Telemetry extract, ReplyMatcher match);
  StopReason tick_loop(const RequestBuilder& build, const Telemetry& extract, const ReplyMatcher& match);
  void finish(StopReason reason);

  ConnectionManager& channel_;
  ControlLoopConfig cfg_;
  Logger log_;
  MovingAverage window_;

  ReachedHandler reached_cb_;
  StoppedHandler stopped_cb_;

  mutable std::mutex mu_;            // target, tolerance, window, stop flag
  std::condition_variable cv_;
  bool stopped_{false};
  CancelToken cancel_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> started_{false};
  std::atomic<bool> latched_{false};
  std::atomic<uint32_t> ticks_{0};
  std::atomic<uint32_t> failures_{0};
};

} // namespace fixturelink

#endif // FIXTURELINK_CONTROL_LOOP_HPP
