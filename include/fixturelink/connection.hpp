/**
 * @page fl-connection fixturelink Connection Manager
 * @file connection.hpp
 * @brief Per-channel lifecycle state machine, reader thread and exchange discipline.
 *
 * @details
 * STATES
 * ------
 *
 *     Disconnected --start()--> Connecting --ack--> Connected
 *                                   |                  |
 *                     retries exhausted      I/O error, repeated desync,
 *                                   |           fault(reason)
 *                                   v                  v
 *                                Faulted <-------------+
 *                                   |
 *                               reset() --> Disconnected
 *
 * Every state change goes through one transition function that checks this
 * table; anything else is refused and logged.
 *
 * CONNECTING
 * ----------
 * The data transport is opened, then the handshake runs `retries` attempts.
 * Each attempt flushes stale input, sends the probe and waits `timeout_ms`.
 * `delay_ms` is slept between attempts only. A silent peer with 3 retries,
 * 100 ms timeout and no delay fails after about 300 ms.
 *
 * CONNECTED
 * ---------
 * One reader thread drives Stream Buffer + Frame Synchronizer and queues
 * complete frames. recv_frame() waits on that queue. A reader cycle that
 * times out after the synchronizer rejected at least one candidate is a
 * desync timeout; `desync_fault_threshold` of them in a row fault the channel.
 *
 * EXCHANGE
 * --------
 * exchange() = drop queued frames, send(), recv_frame(), all under the
 * channel's exchange lock, so exactly one request is in flight. A timeout is
 * returned to the caller and never retried here. Clearing the queue cannot
 * stop a late reply to an earlier request from arriving afterwards; a caller
 * whose replies can be told apart passes a ReplyFilter, and frames it
 * refuses are dropped while the wait continues to the same deadline.
 *
 * Transports are borrowed; they must outlive the manager.
 */
#ifndef FIXTURELINK_CONNECTION_HPP
#define FIXTURELINK_CONNECTION_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "fixturelink/cancel.hpp"
#include "fixturelink/channel_config.hpp"
#include "fixturelink/errors.hpp"
#include "fixturelink/frame_link.hpp"
#include "fixturelink/handshake.hpp"
#include "fixturelink/logger.hpp"

namespace fixturelink {

enum class ConnectionState : uint8_t { Disconnected, Connecting, Connected, Faulted };

const char* to_string(ConnectionState s);

class ConnectionManager {
public:
  /// Frames queued by the reader beyond this are dropped oldest-first.
  static constexpr size_t INBOX_CAPACITY = 64;

  /**
   * @param handshake transport for Echo mode; ignored (may be nullptr) otherwise.
   * Throws ConfigError when @p cfg fails validate() or Echo mode has no handshake transport.
   */
  ConnectionManager(const ChannelConfig& cfg, transport::ITransport& data,
                    transport::ITransport* handshake, const Logger& log);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  ConnectionState state() const { return state_.load(); }

  /// Disconnected -> Connecting -> Connected | Faulted. Ok or ConnectFailed (or Cancelled).
  LinkStatus start(const CancelToken* cancel = nullptr);

  /// Frame and send one body. NotConnected / Faulted outside Connected; IoError faults the channel.
  LinkStatus send(int32_t format_id, const Bytes& body);

  /// Next frame from the reader, waiting at most @p timeout_ms.
  LinkStatus recv_frame(Frame& out, int timeout_ms, const CancelToken* cancel = nullptr);

  /// True when a received frame answers the request just sent.
  using ReplyFilter = std::function<bool(const Frame& reply)>;

  /// Request/response under the exchange lock; stale queued frames are dropped first.
  LinkStatus exchange(int32_t format_id, const Bytes& body, Frame& reply, int timeout_ms,
                      const CancelToken* cancel = nullptr, const ReplyFilter& accept = ReplyFilter());

  /// Escalate to Faulted from outside (control loop, operator). No-op unless Connecting/Connected.
  void fault(const std::string& reason);

  /// Faulted -> Disconnected: stops the reader and closes transports. False in any other state.
  bool reset();

  /// At most one control loop per channel.
  bool acquire_control_loop();
  void release_control_loop();

  const ChannelConfig& config() const { return cfg_; }
  std::string fault_reason() const;
  SyncStats sync_stats() const;

  /// The transition table.
  static bool transition_allowed(ConnectionState from, ConnectionState to);

private:
  bool transition(ConnectionState to, const std::string& why);
  LinkStatus run_handshake(const CancelToken* cancel);
  void sleep_between_attempts(int ms, const CancelToken* cancel);
  void start_reader();
  void stop_reader();
  void reader_main();
  void notify_waiters();

  ChannelConfig cfg_;
  Logger log_;
  transport::ITransport& data_;
  transport::ITransport* hs_transport_;
  FrameLink link_;
  std::unique_ptr<Handshake> handshake_;

  mutable std::mutex state_mu_;
  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  std::string fault_reason_;

  mutable std::mutex inbox_mu_;
  std::condition_variable inbox_cv_;
  std::deque<Frame> inbox_;
  SyncStats stats_snapshot_;

  std::mutex exchange_mu_;
  std::thread reader_;
  CancelToken reader_cancel_;
  std::atomic<bool> loop_owned_{false};
};

} // namespace fixturelink

#endif // FIXTURELINK_CONNECTION_HPP
