/**
 * @file cancel.hpp
 * @brief Deadlines and cooperative cancellation shared by every blocking call.
 *
 * Blocking operations take an absolute `Deadline` (never a relative timeout,
 * so nested waits cannot stretch the caller's budget) and an optional
 * `CancelToken*`. Waits are sliced (see StreamBuffer::SLICE_MS) and the token
 * is checked between slices.
 */
#ifndef FIXTURELINK_CANCEL_HPP
#define FIXTURELINK_CANCEL_HPP

#include <atomic>
#include <chrono>

namespace fixturelink {

using Clock    = std::chrono::steady_clock;
using Deadline = Clock::time_point;

inline Deadline deadline_after_ms(long ms) { return Clock::now() + std::chrono::milliseconds(ms); }

/// Milliseconds left until @p d, rounded up, never negative.
inline long ms_until(Deadline d) {
  const auto left = d - Clock::now();
  if (left <= Clock::duration::zero()) return 0;
  return static_cast<long>(std::chrono::ceil<std::chrono::milliseconds>(left).count());
}

class CancelToken {
public:
  void cancel() { flag_.store(true, std::memory_order_release); }
  void reset()  { flag_.store(false, std::memory_order_release); }
  bool cancelled() const { return flag_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> flag_{false};
};

inline bool is_cancelled(const CancelToken* t) { return t && t->cancelled(); }

} // namespace fixturelink

#endif // FIXTURELINK_CANCEL_HPP
