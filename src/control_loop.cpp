// ============================================================================
// control_loop.cpp — implementation for control_loop.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "fixturelink/control_loop.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <string>

namespace fixturelink {

const char* to_string(StopReason r) {
  switch (r) {
    case StopReason::Cancelled:   return "cancelled";
    case StopReason::Faulted:     return "faulted";
    case StopReason::ChannelLost: return "channel_lost";
    case StopReason::Error:       return "error";
  }
  return "unknown";
}

static const ControlLoopConfig& checked(const ControlLoopConfig& c) {
  if (c.period_ms < 1)                throw ConfigError("control loop period_ms must be >= 1");
  if (c.tick_deadline_ms < 1)         throw ConfigError("control loop tick_deadline_ms must be >= 1");
  if (c.max_consecutive_failures < 0) throw ConfigError("control loop max_consecutive_failures must be >= 0");
  if (!(c.tolerance >= 0.0))          throw ConfigError("control loop tolerance must be >= 0");
  return c;
}

ControlLoop::ControlLoop(ConnectionManager& channel, const ControlLoopConfig& cfg, const Logger& log)
: channel_(channel),
  cfg_(checked(cfg)),
  log_(log.child("loop:" + channel.config().name)),
  window_(cfg.window_size) {}

ControlLoop::~ControlLoop() {
  cancel();
  join();
}

bool ControlLoop::start(RequestBuilder build, Telemetry extract, ReplyMatcher match) {
  if (started_.exchange(true)) {
    log_.warn("start refused: this loop already ran");
    return false;
  }
  if (channel_.state() != ConnectionState::Connected) {
    log_.warn(std::string("start refused: channel is ") + to_string(channel_.state()));
    started_.store(false);
    return false;
  }
  if (!channel_.acquire_control_loop()) {
    log_.warn("start refused: another control loop owns the channel");
    started_.store(false);
    return false;
  }

  running_.store(true);
  thread_ = std::thread(&ControlLoop::run, this, std::move(build), std::move(extract), std::move(match));
  return true;
}

void ControlLoop::cancel() {
  cancel_.cancel();
  { std::lock_guard<std::mutex> lk(mu_); }
  cv_.notify_all();
}

void ControlLoop::join() {
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
}

bool ControlLoop::wait_stopped(int timeout_ms) {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this] { return stopped_; });
}

void ControlLoop::set_target(double target, double tolerance) {
  std::lock_guard<std::mutex> lk(mu_);
  cfg_.target = target;
  cfg_.tolerance = tolerance;
  latched_.store(false);
}

std::optional<double> ControlLoop::average() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (window_.size() == 0) return std::nullopt;
  return window_.value();
}

// ---------------------------------------------------------------------------
// run()
// -----
// Thread entry. Whatever tick_loop() does, finish() runs once afterwards.
// A throwing callback ends the loop with StopReason::Error.
// ---------------------------------------------------------------------------
void ControlLoop::run(RequestBuilder build, Telemetry extract, ReplyMatcher match) {
  StopReason reason = StopReason::Error;
  try {
    reason = tick_loop(build, extract, match);
  } catch (const std::exception& e) {
    log_.error(std::string("aborted: ") + e.what());
  }
  finish(reason);
}

StopReason ControlLoop::tick_loop(const RequestBuilder& build, const Telemetry& extract, const ReplyMatcher& match) {
  const auto t0 = Clock::now();
  uint32_t seq = 0;

  for (;;) {
    if (cancel_.cancelled()) return StopReason::Cancelled;

    const auto tick_start = Clock::now();
    ++seq;
    const auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(tick_start - t0).count();
    const Bytes request = build(seq, static_cast<uint32_t>(ts));

    ConnectionManager::ReplyFilter accept;
    if (match) accept = [&match, seq](const Frame& f) { return match(f, seq); };

    Frame reply;
    const LinkStatus st =
        channel_.exchange(cfg_.request_format_id, request, reply, cfg_.tick_deadline_ms, &cancel_, accept);
    ++ticks_;

    if (st == LinkStatus::Cancelled) return StopReason::Cancelled;
    if (st != LinkStatus::Ok && st != LinkStatus::Timeout) {
      log_.warn(std::string("channel gone: ") + to_string(st));
      return StopReason::ChannelLost;
    }

    std::optional<double> sample;
    if (st == LinkStatus::Ok) sample = extract(reply);

    if (!sample) {
      const uint32_t n = ++failures_;
      log_.warn("seq " + std::to_string(seq) + (st == LinkStatus::Timeout ? " timed out" : " reply unreadable") +
                " (" + std::to_string(n) + " in a row)");
      if (n > static_cast<uint32_t>(cfg_.max_consecutive_failures)) {
        channel_.fault("control loop: " + std::to_string(n) + " consecutive missed responses");
        return StopReason::Faulted;
      }
    } else {
      failures_.store(0);
      bool fire = false;
      double avg = 0.0;
      {
        std::lock_guard<std::mutex> lk(mu_);
        window_.push(*sample);
        if (window_.full()) {
          avg = window_.value();
          if (std::fabs(avg - cfg_.target) <= cfg_.tolerance && !latched_.load()) {
            latched_.store(true);
            fire = true;
          }
        }
      }
      if (fire) {
        log_.info("reached target, average " + std::to_string(avg));
        if (reached_cb_) reached_cb_(avg);
      }
    }

    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_until(lk, tick_start + std::chrono::milliseconds(cfg_.period_ms),
                   [this] { return cancel_.cancelled(); });
  }
}

void ControlLoop::finish(StopReason reason) {
  channel_.release_control_loop();
  log_.info(std::string("stopped: ") + to_string(reason) + " after " + std::to_string(ticks_.load()) + " ticks");

  if (stopped_cb_) {
    try {
      stopped_cb_(reason);
    } catch (const std::exception& e) {
      log_.error(std::string("on_stopped handler threw: ") + e.what());
    }
  }

  running_.store(false);
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopped_ = true;
  }
  cv_.notify_all();
}

} // namespace fixturelink
