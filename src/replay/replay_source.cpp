#include "replay/replay_source.h"
#include <algorithm>

namespace tripsense {

ReplaySource::ReplaySource(std::vector<TraceEvent> events,
                           std::shared_ptr<Clock> clock)
    : Service("replay_source"), events_(std::move(events)),
      clock_(std::move(clock)), logger_(Logger::get("replay")) {}

ReplaySource::~ReplaySource() {
  if (running_) {
    stop();
  }
}

bool ReplaySource::init() {
  if (!clock_) {
    LOG_ERROR(logger_, "replay source has no clock");
    return false;
  }
  LOG_INFO(logger_, "replay source initialized: {} events, speed {}x",
           events_.size(), clock_->rate());
  return true;
}

bool ReplaySource::start() {
  if (running_)
    return true;

  base_elapsed_ns_ = clock_->elapsed_realtime_ns();
  base_epoch_ms_ = clock_->now_ms();
  finished_ = false;
  running_ = true;
  playback_thread_ = std::thread(&ReplaySource::playback_loop, this);
  LOG_INFO(logger_, "replay started");
  return true;
}

bool ReplaySource::stop() {
  if (!running_ && !playback_thread_.joinable())
    return true;

  LOG_INFO(logger_, "stopping replay");
  running_ = false;
  cv_.notify_all();

  if (playback_thread_.joinable()) {
    playback_thread_.join();
  }

  auto s = get_stats();
  LOG_INFO(logger_, "replay stats - activity: {}, fixes: {} ({} dropped), "
                    "errors: {}",
           s.activity_delivered, s.fixes_delivered, s.fixes_dropped,
           s.errors_delivered);
  return true;
}

bool ReplaySource::shutdown() {
  stop();
  LOG_INFO(logger_, "replay source shutdown");
  return true;
}

bool ReplaySource::register_transitions(TransitionHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  transition_handler_ = std::move(handler);
  return true;
}

void ReplaySource::unregister_transitions() {
  std::lock_guard<std::mutex> lock(mutex_);
  transition_handler_ = nullptr;
}

bool ReplaySource::request_updates(std::chrono::milliseconds interval,
                                   FixHandler on_fix, ErrorHandler on_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  fix_handler_ = std::move(on_fix);
  error_handler_ = std::move(on_error);
  LOG_DEBUG(logger_, "location updates requested ({} ms, trace cadence used)",
            interval.count());
  return true;
}

void ReplaySource::remove_updates() {
  std::lock_guard<std::mutex> lock(mutex_);
  fix_handler_ = nullptr;
  error_handler_ = nullptr;
}

bool ReplaySource::wait_until_finished(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return finished_.load(); });
}

ReplaySource::Stats ReplaySource::get_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

int ReplaySource::to_activity_code(ActivityType type) {
  switch (type) {
  case ActivityType::IN_VEHICLE:
    return activity_code::IN_VEHICLE;
  case ActivityType::ON_BICYCLE:
    return activity_code::ON_BICYCLE;
  case ActivityType::STILL:
    return activity_code::STILL;
  case ActivityType::TILTING:
    return activity_code::TILTING;
  case ActivityType::WALKING:
    return activity_code::WALKING;
  case ActivityType::RUNNING:
    return activity_code::RUNNING;
  case ActivityType::UNKNOWN:
    return activity_code::UNKNOWN;
  }
  return activity_code::UNKNOWN;
}

void ReplaySource::deliver(const TraceEvent &event) {
  switch (event.kind) {
  case TraceEventKind::ACTIVITY: {
    TransitionHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = transition_handler_;
      if (handler)
        stats_.activity_delivered++;
    }
    if (handler) {
      handler(to_activity_code(event.activity),
              event.transition == TransitionKind::ENTER ? transition_code::ENTER
                                                        : transition_code::EXIT,
              base_elapsed_ns_ + event.offset_ms * 1000000, event.confidence);
    }
    break;
  }
  case TraceEventKind::GPS: {
    FixHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = fix_handler_;
      if (handler)
        stats_.fixes_delivered++;
      else
        stats_.fixes_dropped++;
    }
    if (handler) {
      handler(event.latitude, event.longitude, event.accuracy_m,
              base_epoch_ms_ + event.offset_ms);
    }
    break;
  }
  case TraceEventKind::LOCATION_ERROR: {
    ErrorHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = error_handler_;
      if (handler)
        stats_.errors_delivered++;
    }
    if (handler)
      handler(event.message);
    break;
  }
  }
}

void ReplaySource::playback_loop() {
  for (const auto &event : events_) {
    int64_t target_ns = base_elapsed_ns_ + event.offset_ms * 1000000;

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      int64_t now_ns = clock_->elapsed_realtime_ns();
      if (now_ns >= target_ns)
        break;
      auto wait_ns = static_cast<int64_t>(
          static_cast<double>(target_ns - now_ns) / clock_->rate());
      cv_.wait_for(lock, std::chrono::nanoseconds(std::max<int64_t>(wait_ns, 1)));
    }
    if (!running_)
      return;
    lock.unlock();

    try {
      deliver(event);
    } catch (const std::exception &e) {
      LOG_ERROR(logger_, "replayed event at {} ms threw: {}", event.offset_ms,
                e.what());
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
  }
  cv_.notify_all();
  LOG_INFO(logger_, "replay complete");
}

} // namespace tripsense
