#include "common/clock.h"
#include <algorithm>

namespace tripsense {

int64_t SystemClock::now_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t SystemClock::elapsed_realtime_ns() const {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

ScaledClock::ScaledClock(double rate)
    : rate_(std::max(rate, 0.001)), origin_(std::chrono::steady_clock::now()) {
  SystemClock system;
  origin_epoch_ms_ = system.now_ms();
  origin_elapsed_ns_ = system.elapsed_realtime_ns();
}

int64_t ScaledClock::scaled_ns() const {
  auto real = std::chrono::duration_cast<std::chrono::nanoseconds>(
                  std::chrono::steady_clock::now() - origin_)
                  .count();
  return static_cast<int64_t>(static_cast<double>(real) * rate_);
}

int64_t ScaledClock::now_ms() const {
  return origin_epoch_ms_ + scaled_ns() / 1000000;
}

int64_t ScaledClock::elapsed_realtime_ns() const {
  return origin_elapsed_ns_ + scaled_ns();
}

} // namespace tripsense
