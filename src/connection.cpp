// ============================================================================
// connection.cpp — implementation for connection.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "fixturelink/connection.hpp"

#include <algorithm>
#include <chrono>

namespace fixturelink {

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Faulted:      return "faulted";
  }
  return "unknown";
}

static const ChannelConfig& checked(const ChannelConfig& cfg) {
  validate(cfg);
  return cfg;
}

ConnectionManager::ConnectionManager(const ChannelConfig& cfg, transport::ITransport& data,
                                     transport::ITransport* handshake, const Logger& log)
: cfg_(checked(cfg)),
  log_(log.child("link:" + cfg.name)),
  data_(data),
  hs_transport_(handshake),
  link_(data, cfg_.framing, log_) {
  switch (cfg_.handshake.mode) {
    case HandshakeMode::Echo:
      if (!hs_transport_) throw ConfigError("channel '" + cfg_.name + "': echo handshake without a handshake transport");
      handshake_ = std::make_unique<EchoHandshake>(*hs_transport_, cfg_.handshake.literal, log_);
      break;
    case HandshakeMode::FrameProbe:
      handshake_ = std::make_unique<FrameProbeHandshake>(link_, cfg_.handshake.probe_format_id,
                                                         cfg_.handshake.probe_body, log_);
      break;
    case HandshakeMode::None:
      break;
  }
}

ConnectionManager::~ConnectionManager() {
  stop_reader();
  if (state() != ConnectionState::Disconnected) {
    data_.end();
    if (hs_transport_) hs_transport_->end();
  }
}

// ---------------------------------------------------------------------------
// Transition table
// ---------------------------------------------------------------------------
bool ConnectionManager::transition_allowed(ConnectionState from, ConnectionState to) {
  using S = ConnectionState;
  switch (from) {
    case S::Disconnected: return to == S::Connecting;
    case S::Connecting:   return to == S::Connected || to == S::Faulted;
    case S::Connected:    return to == S::Faulted;
    case S::Faulted:      return to == S::Disconnected;
  }
  return false;
}

bool ConnectionManager::transition(ConnectionState to, const std::string& why) {
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    const ConnectionState from = state_.load();
    if (!transition_allowed(from, to)) {
      log_.warn(std::string("refused transition ") + to_string(from) + " -> " + to_string(to) + " (" + why + ")");
      return false;
    }
    state_.store(to);
    if (to == ConnectionState::Faulted) {
      fault_reason_ = why;
      reader_cancel_.cancel();
      log_.error(std::string("state ") + to_string(from) + " -> faulted: " + why);
    } else {
      if (to == ConnectionState::Disconnected) fault_reason_.clear();
      log_.info(std::string("state ") + to_string(from) + " -> " + to_string(to) + " (" + why + ")");
    }
  }
  notify_waiters();
  return true;
}

void ConnectionManager::notify_waiters() {
  { std::lock_guard<std::mutex> lk(inbox_mu_); }
  inbox_cv_.notify_all();
}

// ---------------------------------------------------------------------------
// start()
// -------
// Already Connected is Ok and does nothing. From Faulted the caller has to
// reset() first.
// ---------------------------------------------------------------------------
LinkStatus ConnectionManager::start(const CancelToken* cancel) {
  const ConnectionState s = state();
  if (s == ConnectionState::Connected) return LinkStatus::Ok;
  if (!transition(ConnectionState::Connecting, "start")) {
    return s == ConnectionState::Faulted ? LinkStatus::Faulted : LinkStatus::NotConnected;
  }

  if (!data_.is_open() && !data_.begin()) {
    transition(ConnectionState::Faulted, std::string("cannot open ") + data_.name() + " transport");
    return LinkStatus::ConnectFailed;
  }
  link_.reset();

  if (handshake_) {
    const LinkStatus hs = run_handshake(cancel);
    if (hs != LinkStatus::Ok) return hs;
  }

  reader_cancel_.reset();
  if (!transition(ConnectionState::Connected, handshake_ ? "handshake answered" : "transport open")) {
    return LinkStatus::Faulted;        // fault() won the race
  }
  start_reader();
  return LinkStatus::Ok;
}

LinkStatus ConnectionManager::run_handshake(const CancelToken* cancel) {
  const HandshakePolicy& p = cfg_.handshake;
  if (!handshake_->open()) {
    transition(ConnectionState::Faulted, "handshake transport did not open");
    return LinkStatus::ConnectFailed;
  }

  for (int attempt = 1; attempt <= p.retries; ++attempt) {
    if (is_cancelled(cancel)) {
      handshake_->close();
      transition(ConnectionState::Faulted, "cancelled while connecting");
      return LinkStatus::Cancelled;
    }
    if (state() != ConnectionState::Connecting) {
      handshake_->close();
      return LinkStatus::ConnectFailed;
    }

    handshake_->flush_stale();
    if (handshake_->send_probe() && handshake_->await_ack(deadline_after_ms(p.timeout_ms), cancel)) {
      log_.info(std::string(handshake_->name()) + " handshake answered on attempt " +
                std::to_string(attempt) + "/" + std::to_string(p.retries));
      handshake_->close();
      return LinkStatus::Ok;
    }
    log_.debug(std::string(handshake_->name()) + " handshake attempt " + std::to_string(attempt) + "/" +
               std::to_string(p.retries) + " unanswered");

    if (attempt < p.retries) sleep_between_attempts(p.delay_ms, cancel);
  }

  handshake_->close();
  transition(ConnectionState::Faulted,
             "handshake unanswered after " + std::to_string(p.retries) + " attempts");
  return LinkStatus::ConnectFailed;
}

void ConnectionManager::sleep_between_attempts(int ms, const CancelToken* cancel) {
  const Deadline until = deadline_after_ms(ms);
  while (Clock::now() < until) {
    if (is_cancelled(cancel)) return;           // picked up at the top of the next attempt
    const long left = ms_until(until);
    std::this_thread::sleep_for(std::chrono::milliseconds(std::min<long>(left, StreamBuffer::SLICE_MS)));
  }
}

// ---------------------------------------------------------------------------
// Reader thread
// ---------------------------------------------------------------------------
void ConnectionManager::start_reader() {
  if (reader_.joinable()) reader_.join();      // previous session, already cancelled
  reader_ = std::thread(&ConnectionManager::reader_main, this);
}

void ConnectionManager::stop_reader() {
  reader_cancel_.cancel();
  if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) reader_.join();
}

// ---------------------------------------------------------------------------
// reader_main()
// -------------
// One read cycle = one recv_timeout_ms window. A cycle that ends in Timeout
// with more rejections than it started with counts toward the desync streak;
// a clean idle cycle or any accepted frame clears it.
// ---------------------------------------------------------------------------
void ConnectionManager::reader_main() {
  int desync_streak = 0;
  log_.debug("reader started");

  while (!reader_cancel_.cancelled()) {
    const uint64_t rejects_before = link_.synchronizer().stats().rejects();
    Frame f;
    const IoStatus st = link_.read_frame(f, deadline_after_ms(cfg_.recv_timeout_ms), &reader_cancel_);
    const SyncStats now = link_.synchronizer().stats();

    {
      std::lock_guard<std::mutex> lk(inbox_mu_);
      stats_snapshot_ = now;
      if (st == IoStatus::Ok) {
        if (inbox_.size() >= INBOX_CAPACITY) {
          inbox_.pop_front();
          log_.warn("inbox full, dropped the oldest frame");
        }
        inbox_.push_back(std::move(f));
      }
    }

    if (st == IoStatus::Ok) {
      desync_streak = 0;
      inbox_cv_.notify_all();
      continue;
    }
    if (st == IoStatus::Cancelled) break;
    if (st == IoStatus::Error) {
      if (!reader_cancel_.cancelled()) transition(ConnectionState::Faulted, "transport read failed");
      break;
    }

    if (now.rejects() > rejects_before) {
      ++desync_streak;
      log_.warn("receive timeout with " + std::to_string(now.rejects() - rejects_before) +
                " rejected candidates (" + std::to_string(desync_streak) + "/" +
                std::to_string(cfg_.desync_fault_threshold) + ")");
      if (desync_streak >= cfg_.desync_fault_threshold) {
        transition(ConnectionState::Faulted,
                   "desync: " + std::to_string(desync_streak) + " receive timeouts with rejected frames");
        break;
      }
    } else {
      desync_streak = 0;
    }
  }
  log_.debug("reader stopped");
}

// ---------------------------------------------------------------------------
// Steady-state I/O
// ---------------------------------------------------------------------------
LinkStatus ConnectionManager::send(int32_t format_id, const Bytes& body) {
  const ConnectionState s = state();
  if (s == ConnectionState::Faulted)   return LinkStatus::Faulted;
  if (s != ConnectionState::Connected) return LinkStatus::NotConnected;

  const LinkStatus st = link_.write_frame(format_id, body);
  if (st == LinkStatus::IoError) transition(ConnectionState::Faulted, "transport write failed");
  return st;
}

LinkStatus ConnectionManager::recv_frame(Frame& out, int timeout_ms, const CancelToken* cancel) {
  const Deadline deadline = deadline_after_ms(timeout_ms);
  std::unique_lock<std::mutex> lk(inbox_mu_);
  for (;;) {
    const ConnectionState s = state();
    if (s == ConnectionState::Faulted)   return LinkStatus::Faulted;
    if (s != ConnectionState::Connected) return LinkStatus::NotConnected;

    if (!inbox_.empty()) {
      out = std::move(inbox_.front());
      inbox_.pop_front();
      return LinkStatus::Ok;
    }
    if (is_cancelled(cancel)) return LinkStatus::Cancelled;

    const Deadline now = Clock::now();
    if (now >= deadline) return LinkStatus::Timeout;
    inbox_cv_.wait_until(lk, std::min(deadline, now + std::chrono::milliseconds(StreamBuffer::SLICE_MS)));
  }
}

LinkStatus ConnectionManager::exchange(int32_t format_id, const Bytes& body, Frame& reply, int timeout_ms,
                                       const CancelToken* cancel, const ReplyFilter& accept) {
  std::lock_guard<std::mutex> ex(exchange_mu_);

  size_t stale = 0;
  {
    std::lock_guard<std::mutex> lk(inbox_mu_);
    stale = inbox_.size();
    inbox_.clear();
  }
  if (stale) log_.debug("dropped " + std::to_string(stale) + " stale frames before request");

  const LinkStatus st = send(format_id, body);
  if (st != LinkStatus::Ok) return st;

  const Deadline deadline = deadline_after_ms(timeout_ms);
  for (;;) {
    const LinkStatus rs = recv_frame(reply, static_cast<int>(ms_until(deadline)), cancel);
    if (rs != LinkStatus::Ok || !accept || accept(reply)) return rs;
    log_.debug("dropped reply that does not answer this request (format " + std::to_string(reply.format_id) + ")");
  }
}

// ---------------------------------------------------------------------------
// Fault / reset / ownership
// ---------------------------------------------------------------------------
void ConnectionManager::fault(const std::string& reason) {
  const ConnectionState s = state();
  if (s != ConnectionState::Connecting && s != ConnectionState::Connected) {
    log_.debug("fault(" + reason + ") ignored in state " + to_string(s));
    return;
  }
  transition(ConnectionState::Faulted, reason);
}

bool ConnectionManager::reset() {
  if (state() != ConnectionState::Faulted) {
    log_.warn(std::string("reset refused in state ") + to_string(state()));
    return false;
  }
  stop_reader();
  data_.end();
  if (hs_transport_) hs_transport_->end();
  link_.reset();
  {
    std::lock_guard<std::mutex> lk(inbox_mu_);
    inbox_.clear();
  }
  return transition(ConnectionState::Disconnected, "reset");
}

bool ConnectionManager::acquire_control_loop() {
  bool expected = false;
  return loop_owned_.compare_exchange_strong(expected, true);
}

void ConnectionManager::release_control_loop() { loop_owned_.store(false); }

std::string ConnectionManager::fault_reason() const {
  std::lock_guard<std::mutex> lk(state_mu_);
  return fault_reason_;
}

SyncStats ConnectionManager::sync_stats() const {
  std::lock_guard<std::mutex> lk(inbox_mu_);
  return stats_snapshot_;
}

} // namespace fixturelink
