#include "detection/event_loop.h"
#include <future>

namespace tripsense {

EventLoop::EventLoop(std::shared_ptr<Clock> clock)
    : Service("event_loop"), clock_(std::move(clock)),
      logger_(Logger::get("loop")) {}

EventLoop::~EventLoop() {
  if (running_) {
    stop();
  }
}

bool EventLoop::init() {
  if (!clock_) {
    LOG_ERROR(logger_, "event loop has no clock");
    return false;
  }
  LOG_INFO(logger_, "event loop initialized (clock rate {}x)", clock_->rate());
  return true;
}

bool EventLoop::start() {
  if (running_)
    return true;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tasks_.empty()) {
      LOG_DEBUG(logger_, "dropping {} task(s) posted while stopped",
                tasks_.size());
      tasks_.clear();
    }
  }
  running_ = true;
  thread_ = std::thread(&EventLoop::run, this);
  LOG_INFO(logger_, "event loop started");
  return true;
}

bool EventLoop::stop() {
  if (!running_)
    return true;

  LOG_INFO(logger_, "stopping event loop");
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.timers_cancelled += timers_.size();
    timers_.clear();
    running_ = false;
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
  return true;
}

bool EventLoop::shutdown() {
  stop();
  auto s = get_stats();
  LOG_INFO(logger_,
           "event loop shutdown - tasks: {}, timers fired: {}, cancelled: {}, "
           "errors: {}",
           s.tasks_run, s.timers_fired, s.timers_cancelled, s.task_errors);
  return true;
}

void EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task fn) {
  int64_t delay_ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(delay).count();
  TimerId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = ++next_timer_id_;
    timers_.emplace(id, Timer{clock_->elapsed_realtime_ns() +
                                  std::max<int64_t>(delay_ns, 0),
                              std::move(fn)});
  }
  cv_.notify_one();
  return id;
}

void EventLoop::cancel(TimerId id) {
  if (id == kInvalidTimer)
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (timers_.erase(id) > 0)
    stats_.timers_cancelled++;
}

bool EventLoop::flush(std::chrono::milliseconds timeout) {
  if (on_loop_thread()) {
    LOG_WARN(logger_, "flush() called from the loop thread");
    return false;
  }
  if (!running_) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.empty();
  }

  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  post([done] { done->set_value(); });
  return future.wait_for(timeout) == std::future_status::ready;
}

bool EventLoop::on_loop_thread() const {
  return std::this_thread::get_id() == loop_thread_id_;
}

size_t EventLoop::pending_timers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

EventLoop::Stats EventLoop::get_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::map<TimerId, EventLoop::Timer>::iterator EventLoop::earliest_timer() {
  auto earliest = timers_.end();
  for (auto it = timers_.begin(); it != timers_.end(); ++it) {
    // ids increase monotonically, so equal deadlines keep scheduling order
    if (earliest == timers_.end() ||
        it->second.deadline_ns < earliest->second.deadline_ns)
      earliest = it;
  }
  return earliest;
}

void EventLoop::run_task(const Task &task, const char *kind) {
  try {
    task();
  } catch (const std::exception &e) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.task_errors++;
    LOG_ERROR(logger_, "{} threw: {}", kind, e.what());
  } catch (...) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.task_errors++;
    LOG_ERROR(logger_, "{} threw a non-standard exception", kind);
  }
}

void EventLoop::run() {
  loop_thread_id_ = std::this_thread::get_id();
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    int64_t now = clock_->elapsed_realtime_ns();
    auto timer = earliest_timer();

    if (timer != timers_.end() && timer->second.deadline_ns <= now) {
      Task fn = std::move(timer->second.fn);
      timers_.erase(timer);
      stats_.timers_fired++;
      lock.unlock();
      run_task(fn, "timer");
      lock.lock();
      continue;
    }

    if (!tasks_.empty()) {
      Task task = std::move(tasks_.front());
      tasks_.pop_front();
      stats_.tasks_run++;
      lock.unlock();
      run_task(task, "task");
      lock.lock();
      continue;
    }

    if (!running_)
      break;

    if (timer == timers_.end()) {
      cv_.wait(lock);
    } else {
      auto wait_ns = static_cast<int64_t>(
          static_cast<double>(timer->second.deadline_ns - now) /
          clock_->rate());
      cv_.wait_for(lock, std::chrono::nanoseconds(std::max<int64_t>(wait_ns, 1)));
    }
  }

  LOG_DEBUG(logger_, "event loop exited");
}

} // namespace tripsense
