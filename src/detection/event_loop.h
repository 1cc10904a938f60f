#pragma once

#include "common/clock.h"
#include "common/logger.h"
#include "detection/timer_scheduler.h"
#include "services/service.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace tripsense {

using Task = std::function<void()>;

// Single-consumer queue that serializes every detection input. Producers
// on any thread post() tasks; timers fire on the loop thread and a due
// timer runs before the next queued task. Exceptions escaping a task are
// logged and the loop keeps running.
class EventLoop : public Service, public TimerScheduler {
public:
  explicit EventLoop(std::shared_ptr<Clock> clock);
  ~EventLoop() override;

  bool init() override;
  bool start() override;
  bool stop() override;
  bool shutdown() override;

  void post(Task task);

  TimerId schedule(std::chrono::milliseconds delay, Task fn) override;
  void cancel(TimerId id) override;

  // Blocks until every task posted before the call, and every timer due by
  // then, has run. Returns false on timeout or when called from the loop.
  bool flush(std::chrono::milliseconds timeout);

  bool running() const override { return running_; }
  bool on_loop_thread() const;
  size_t pending_timers() const;

  struct Stats {
    uint64_t tasks_run{0};
    uint64_t timers_fired{0};
    uint64_t timers_cancelled{0};
    uint64_t task_errors{0};
  };
  Stats get_stats() const;

private:
  struct Timer {
    int64_t deadline_ns;
    Task fn;
  };

  void run();
  void run_task(const Task &task, const char *kind);
  std::map<TimerId, Timer>::iterator earliest_timer();

  std::shared_ptr<Clock> clock_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  std::map<TimerId, Timer> timers_;
  TimerId next_timer_id_{0};

  std::atomic<bool> running_{false};
  std::thread thread_;
  std::atomic<std::thread::id> loop_thread_id_;

  Stats stats_;
};

} // namespace tripsense
