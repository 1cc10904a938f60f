#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace tripsense {

using TimerId = uint64_t;
constexpr TimerId kInvalidTimer = 0;

// Cancellable one-shot timers. Callbacks run in the same serialized
// context as every other state machine input.
class TimerScheduler {
public:
  virtual ~TimerScheduler() = default;

  virtual TimerId schedule(std::chrono::milliseconds delay,
                           std::function<void()> fn) = 0;
  // no-op for fired, cancelled or unknown ids
  virtual void cancel(TimerId id) = 0;
};

} // namespace tripsense
