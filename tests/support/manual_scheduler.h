#pragma once

#include "detection/timer_scheduler.h"
#include "support/manual_clock.h"
#include <map>
#include <memory>

namespace tripsense {
namespace test {

// Timers fire only from advance(), on the calling thread, in deadline
// order. The clock is stepped to each deadline before its timer runs.
class ManualScheduler : public TimerScheduler {
public:
  explicit ManualScheduler(std::shared_ptr<ManualClock> clock)
      : clock_(std::move(clock)) {}

  TimerId schedule(std::chrono::milliseconds delay,
                   std::function<void()> fn) override {
    TimerId id = ++next_id_;
    timers_[id] = Timer{clock_->now_ms() + delay.count(), std::move(fn)};
    return id;
  }

  void cancel(TimerId id) override {
    if (ignore_cancel_)
      return;
    timers_.erase(id);
  }

  void advance(int64_t ms) {
    int64_t target = clock_->now_ms() + ms;
    while (true) {
      auto next = timers_.end();
      for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.deadline_ms <= target &&
            (next == timers_.end() ||
             it->second.deadline_ms < next->second.deadline_ms))
          next = it;
      }
      if (next == timers_.end())
        break;

      Timer timer = std::move(next->second);
      timers_.erase(next);
      if (timer.deadline_ms > clock_->now_ms())
        clock_->set(timer.deadline_ms);
      fired_++;
      timer.fn();
    }
    if (target > clock_->now_ms())
      clock_->set(target);
  }

  size_t pending() const { return timers_.size(); }
  size_t fired() const { return fired_; }

  // Simulates a timer that was already dequeued when its cancel arrived.
  void set_ignore_cancel(bool ignore) { ignore_cancel_ = ignore; }

private:
  struct Timer {
    int64_t deadline_ms;
    std::function<void()> fn;
  };

  std::shared_ptr<ManualClock> clock_;
  std::map<TimerId, Timer> timers_;
  TimerId next_id_{0};
  size_t fired_{0};
  bool ignore_cancel_{false};
};

} // namespace test
} // namespace tripsense
