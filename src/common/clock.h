#pragma once

#include <chrono>
#include <cstdint>

namespace tripsense {

class Clock {
public:
  virtual ~Clock() = default;

  // wall clock, milliseconds since the unix epoch
  virtual int64_t now_ms() const = 0;
  // monotonic, nanoseconds since boot (the activity recognition time base)
  virtual int64_t elapsed_realtime_ns() const = 0;
  // clock seconds per real second
  virtual double rate() const { return 1.0; }

  int64_t to_epoch_ms(int64_t elapsed_ns) const {
    return now_ms() - (elapsed_realtime_ns() - elapsed_ns) / 1000000;
  }
};

class SystemClock : public Clock {
public:
  int64_t now_ms() const override;
  int64_t elapsed_realtime_ns() const override;
};

// Runs `rate` times faster than real time from the moment it is created.
// Used to replay recorded traces without waiting out every debounce window.
class ScaledClock : public Clock {
public:
  explicit ScaledClock(double rate);

  int64_t now_ms() const override;
  int64_t elapsed_realtime_ns() const override;
  double rate() const override { return rate_; }

private:
  int64_t scaled_ns() const;

  double rate_;
  std::chrono::steady_clock::time_point origin_;
  int64_t origin_epoch_ms_;
  int64_t origin_elapsed_ns_;
};

} // namespace tripsense
