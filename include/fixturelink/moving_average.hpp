/**
 * @file moving_average.hpp
 * @brief Fixed-window arithmetic mean over the most recent samples.
 *
 * Storage is an etl::deque sized at compile time; the active window is chosen
 * at runtime and must not exceed FIXTURELINK_MAX_AVERAGE_WINDOW. Pushing into
 * a full window evicts the oldest sample first.
 */
#ifndef FIXTURELINK_MOVING_AVERAGE_HPP
#define FIXTURELINK_MOVING_AVERAGE_HPP

#include <cstddef>
#include <string>

#include "etl/deque.h"
#include "fixturelink/errors.hpp"

namespace fixturelink {

#ifndef FIXTURELINK_MAX_AVERAGE_WINDOW
#define FIXTURELINK_MAX_AVERAGE_WINDOW 64
#endif

class MovingAverage {
public:
  explicit MovingAverage(size_t window) : window_(window) {
    if (window == 0 || window > FIXTURELINK_MAX_AVERAGE_WINDOW) {
      throw ConfigError("moving average window " + std::to_string(window) + " outside [1, " +
                        std::to_string(FIXTURELINK_MAX_AVERAGE_WINDOW) + "]");
    }
  }

  void push(double sample) {
    if (samples_.size() == window_) samples_.pop_front();
    samples_.push_back(sample);
  }

  /// Mean of the samples held; 0 when empty.
  double value() const {
    if (samples_.empty()) return 0.0;
    double sum = 0.0;
    for (double s : samples_) sum += s;
    return sum / static_cast<double>(samples_.size());
  }

  bool   full() const { return samples_.size() == window_; }
  size_t size() const { return samples_.size(); }
  size_t window() const { return window_; }
  void   clear() { samples_.clear(); }

private:
  size_t window_;
  etl::deque<double, FIXTURELINK_MAX_AVERAGE_WINDOW> samples_;
};

} // namespace fixturelink

#endif // FIXTURELINK_MOVING_AVERAGE_HPP
