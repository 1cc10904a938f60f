#include "capture/activity_stream.h"
#include <algorithm>

namespace tripsense {

ActivityStream::ActivityStream(
    std::shared_ptr<ActivityRecognitionSource> source, int default_confidence)
    : Stream("activity_stream"), source_(std::move(source)),
      default_confidence_(std::clamp(default_confidence, 0, 100)),
      logger_(Logger::get("activity")) {}

ActivityStream::~ActivityStream() {
  if (running_) {
    stop();
  }
}

bool ActivityStream::init() {
  if (!source_) {
    LOG_ERROR(logger_, "no activity recognition source available");
    return false;
  }
  LOG_INFO(logger_, "activity stream initialized (default confidence {})",
           default_confidence_);
  return true;
}

bool ActivityStream::start() {
  if (running_)
    return true;
  if (!source_) {
    LOG_ERROR(logger_, "cannot start: no activity recognition source");
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_.reset();
  }
  running_ = true;

  bool registered = false;
  try {
    registered = source_->register_transitions(
        [this](int activity, int transition, int64_t nanos, int confidence) {
          on_transition(activity, transition, nanos, confidence);
        });
  } catch (const std::exception &e) {
    LOG_ERROR(logger_, "activity transition registration threw: {}", e.what());
    registered = false;
  }

  if (!registered) {
    running_ = false;
    LOG_ERROR(logger_, "activity transition registration failed");
    return false;
  }

  LOG_INFO(logger_, "activity stream started");
  return true;
}

bool ActivityStream::stop() {
  if (!running_)
    return true;

  LOG_INFO(logger_, "stopping activity stream");
  running_ = false;
  try {
    source_->unregister_transitions();
  } catch (const std::exception &e) {
    LOG_WARN(logger_, "activity transition unregistration threw: {}",
             e.what());
    return false;
  }
  return true;
}

bool ActivityStream::shutdown() {
  bool ok = stop();
  auto s = get_stats();
  LOG_INFO(logger_,
           "activity stream shutdown - received: {}, published: {}, "
           "duplicates: {}, malformed: {}",
           s.received, s.published, s.duplicates, s.malformed);
  return ok;
}

ActivityType ActivityStream::map_activity_code(int code) {
  switch (code) {
  case activity_code::IN_VEHICLE:
    return ActivityType::IN_VEHICLE;
  case activity_code::ON_BICYCLE:
    return ActivityType::ON_BICYCLE;
  case activity_code::ON_FOOT:
  case activity_code::WALKING:
    return ActivityType::WALKING;
  case activity_code::RUNNING:
    return ActivityType::RUNNING;
  case activity_code::STILL:
    return ActivityType::STILL;
  case activity_code::TILTING:
    return ActivityType::TILTING;
  default:
    return ActivityType::UNKNOWN;
  }
}

ActivityStream::Stats ActivityStream::get_stats() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stats_;
}

void ActivityStream::on_transition(int activity_code, int transition_code,
                                   int64_t elapsed_realtime_ns,
                                   int confidence) {
  if (!running_)
    return;

  ActivityObservation obs;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stats_.received++;

    if (transition_code != transition_code::ENTER &&
        transition_code != transition_code::EXIT) {
      stats_.malformed++;
      LOG_WARN(logger_, "ignoring unknown transition code {} for activity {}",
               transition_code, activity_code);
      return;
    }

    obs.activity_type = map_activity_code(activity_code);
    obs.transition_kind = transition_code == transition_code::ENTER
                              ? TransitionKind::ENTER
                              : TransitionKind::EXIT;
    obs.observed_at_nanos = elapsed_realtime_ns;
    obs.confidence =
        confidence < 0 ? default_confidence_ : std::min(confidence, 100);

    if (last_ && *last_ == obs) {
      stats_.duplicates++;
      LOG_DEBUG(logger_, "duplicate transition dropped: {} {}",
                activity_to_string(obs.activity_type),
                transition_to_string(obs.transition_kind));
      return;
    }
    last_ = obs;
    stats_.published++;
  }

  LOG_DEBUG(logger_, "transition: {} {} (confidence {})",
            activity_to_string(obs.activity_type),
            transition_to_string(obs.transition_kind), obs.confidence);
  publish(obs);
}

} // namespace tripsense
