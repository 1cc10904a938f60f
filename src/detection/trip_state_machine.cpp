#include "detection/trip_state_machine.h"
#include "estimation/trip_estimator.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tripsense {

namespace {

std::string gps_place(const GpsFix &fix) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(4) << "GPS: (" << fix.latitude
      << ", " << fix.longitude << ")";
  return oss.str();
}

} // namespace

TripStateMachine::TripStateMachine(const DetectionConfig &config,
                                   std::shared_ptr<Clock> clock,
                                   TimerScheduler &scheduler,
                                   std::shared_ptr<LocationControl> location)
    : config_(config), clock_(std::move(clock)), scheduler_(scheduler),
      location_(std::move(location)), logger_(Logger::get("trip_sm")) {}

TripStateMachine::~TripStateMachine() { scheduler_.cancel(timer_); }

int64_t TripStateMachine::event_time_ms(const ActivityObservation &obs) {
  int64_t now = clock_->now_ms();
  int64_t t = clock_->to_epoch_ms(obs.observed_at_nanos);
  if (t > now) {
    LOG_DEBUG(logger_, "event time {} ahead of clock, clamped to {}", t, now);
    t = now;
  }
  // late events never move trip time backwards
  t = std::max(t, last_event_ms_);
  last_event_ms_ = t;
  return t;
}

bool TripStateMachine::track_moving(const ActivityObservation &obs) {
  ActivityType type = obs.activity_type;
  bool enter = obs.transition_kind == TransitionKind::ENTER;

  if (is_moving(type)) {
    if (enter) {
      active_moving_.insert(type);
      return true;
    }
    if (active_moving_.erase(type) == 0) {
      LOG_DEBUG(logger_, "ignoring EXIT {} (not entered)",
                activity_to_string(type));
      return false;
    }
    return true;
  }

  if (type == ActivityType::STILL && enter) {
    active_moving_.clear();
    return true;
  }

  // EXIT STILL, TILTING and UNKNOWN say nothing about trip boundaries
  return false;
}

void TripStateMachine::on_activity(const ActivityObservation &obs) {
  if (last_observation_ && *last_observation_ == obs) {
    stats_.duplicates++;
    LOG_DEBUG(logger_, "duplicate {} {} dropped",
              activity_to_string(obs.activity_type),
              transition_to_string(obs.transition_kind));
    return;
  }
  last_observation_ = obs;

  int64_t t = event_time_ms(obs);
  LOG_DEBUG(logger_, "[{}] {} {} (confidence {})", trip_state_to_string(state_),
            transition_to_string(obs.transition_kind),
            activity_to_string(obs.activity_type), obs.confidence);

  if (!track_moving(obs))
    return;

  bool moving_enter = obs.transition_kind == TransitionKind::ENTER &&
                      is_moving(obs.activity_type);
  bool movement_lost = active_moving_.empty();

  switch (state_) {
  case TripState::IDLE:
    if (moving_enter)
      begin_candidate(obs, t);
    break;

  case TripState::CANDIDATE_MOVING:
    if (moving_enter) {
      candidate_->activity = obs.activity_type;
      candidate_->samples.push_back({obs.activity_type, obs.confidence});
    } else if (movement_lost) {
      cancel_candidate(t);
    }
    break;

  case TripState::ACTIVE_TRIP:
    if (moving_enter)
      add_sample(obs);
    else if (movement_lost)
      begin_stop(t);
    break;

  case TripState::CANDIDATE_STILL:
    if (moving_enter)
      resume_trip(obs, t);
    break;

  case TripState::CLOSING:
    break;
  }
}

void TripStateMachine::begin_candidate(const ActivityObservation &obs,
                                       int64_t t) {
  candidate_ = MovingCandidate{t, obs.activity_type,
                               {{obs.activity_type, obs.confidence}}};
  transition(TripState::CANDIDATE_MOVING, t);
  emit_log(make_log(GpsLogType::CONFIRMATION_STARTED));
  arm(config_.moving_debounce_s, t, &TripStateMachine::on_moving_confirmed);
}

void TripStateMachine::cancel_candidate(int64_t t) {
  GpsLogEvent event = make_log(GpsLogType::CONFIRMATION_CANCELLED);
  event.detail = "movement ended before confirmation";
  LOG_INFO(logger_, "candidate {} cancelled after {} ms", event.activity,
           t - candidate_->since_ms);
  candidate_.reset();
  stats_.candidates_cancelled++;
  transition(TripState::IDLE, t);
  emit_log(event);
}

void TripStateMachine::on_moving_confirmed() {
  if (state_ != TripState::CANDIDATE_MOVING || !candidate_)
    return;

  int64_t now = clock_->now_ms();
  if (active_moving_.empty()) {
    cancel_candidate(now);
    return;
  }

  TripSession session;
  session.id = ++next_session_id_;
  session.started_at_millis = candidate_->since_ms;
  session.candidate_activity = candidate_->activity;
  session.confidence_samples = std::move(candidate_->samples);
  candidate_.reset();
  session_ = std::move(session);
  stats_.sessions_opened++;

  transition(TripState::ACTIVE_TRIP, now);
  LOG_INFO(logger_, "trip #{} started at {} ({})", session_->id,
           session_->started_at_millis,
           activity_to_string(session_->candidate_activity));

  bool tracking = false;
  if (location_) {
    tracking = location_->start_tracking();
  }
  session_->location_available = tracking;
  if (tracking) {
    emit_log(make_log(GpsLogType::GPS_START));
  } else {
    LOG_WARN(logger_, "location unavailable, distance will be estimated");
    emit_log(make_log(GpsLogType::GPS_UNAVAILABLE));
  }
}

void TripStateMachine::add_sample(const ActivityObservation &obs) {
  session_->candidate_activity = obs.activity_type;
  session_->confidence_samples.push_back({obs.activity_type, obs.confidence});
}

void TripStateMachine::begin_stop(int64_t t) {
  session_->still_since_millis = t;
  transition(TripState::CANDIDATE_STILL, t);
  emit_log(make_log(GpsLogType::STOP_PENDING_CONFIRMATION));
  arm(config_.stop_debounce_s, t, &TripStateMachine::on_stop_confirmed);
}

void TripStateMachine::resume_trip(const ActivityObservation &obs, int64_t t) {
  LOG_INFO(logger_, "trip #{} resumed after {} ms stop", session_->id,
           t - session_->still_since_millis);
  session_->still_since_millis = 0;
  add_sample(obs);
  transition(TripState::ACTIVE_TRIP, t);
  emit_log(make_log(GpsLogType::TRIP_RESUMED));
}

void TripStateMachine::on_stop_confirmed() {
  if (state_ != TripState::CANDIDATE_STILL || !session_)
    return;
  close_session();
}

void TripStateMachine::close_session() {
  int64_t now = clock_->now_ms();
  transition(TripState::CLOSING, now);
  stop_location();

  TripSession &s = *session_;
  int64_t start = s.started_at_millis;
  int64_t end = std::max(s.still_since_millis, start);

  std::vector<GpsFix> points;
  for (const auto &fix : s.accepted_gps_points) {
    if (fix.observed_at_millis <= end)
      points.push_back(fix);
  }

  int duration_min =
      static_cast<int>(std::llround(static_cast<double>(end - start) / 60000.0));

  Classification cls = estimator::classify_transport_type(
      s.confidence_samples, s.candidate_activity, config_.default_confidence);

  bool enough_points =
      static_cast<int>(points.size()) >= config_.min_gps_points;
  bool gps_based = enough_points && s.location_available;
  double distance_km;
  if (gps_based) {
    DistanceParams params{config_.accuracy_threshold_m, config_.max_gps_gap_s};
    distance_km = estimator::accumulate_distance(points, params);
  } else {
    distance_km = estimator::estimate_distance_from_duration(
        duration_min, cls.dominant_activity, config_.speeds);
    // location lost mid-trip: the track only covers part of the trip
    if (enough_points) {
      DistanceParams params{config_.accuracy_threshold_m,
                            config_.max_gps_gap_s};
      distance_km = std::max(distance_km,
                             estimator::accumulate_distance(points, params));
    }
  }

  GpsQualityReport quality =
      estimator::score_gps_quality(points, s.rejected_fix_count);
  LOG_INFO(logger_,
           "trip #{} closing - {} min, {:.3f} km ({}), gps {} ({} accepted, "
           "{} rejected)",
           s.id, duration_min, distance_km, gps_based ? "gps" : "estimated",
           gps_quality_to_string(quality.quality), quality.accepted,
           quality.rejected);

  GpsLogEvent stats_event = make_log(GpsLogType::GPS_STATS);
  stats_event.distance_km = distance_km;
  stats_event.gps_points = static_cast<int>(points.size());
  stats_event.is_gps_based = gps_based;
  stats_event.detail = gps_quality_to_string(quality.quality);
  emit_log(stats_event);

  std::optional<DiscardReason> discard;
  if (duration_min < config_.min_trip_duration_min)
    discard = DiscardReason::TOO_SHORT;
  else if (distance_km < config_.min_trip_distance_km)
    discard = DiscardReason::TOO_FEW_KM;

  if (discard) {
    LOG_INFO(logger_, "trip #{} discarded: {}", s.id,
             discard_reason_to_string(*discard));
    GpsLogEvent event = make_log(GpsLogType::TRIP_DISCARDED);
    event.distance_km = distance_km;
    event.detail = discard_reason_to_string(*discard);
    stats_.trips_discarded++;
    session_.reset();
    transition(TripState::IDLE, now);
    emit_log(event);
    return;
  }

  LocalJourney journey;
  journey.time_departure = start;
  journey.time_arrival = end;
  journey.duration_minutes = duration_min;
  journey.distance_km = distance_km;
  journey.detected_transport_type = cls.transport_type;
  journey.confidence_avg = cls.confidence_avg;
  journey.is_gps_based_distance = gps_based;
  journey.gps_points_count = static_cast<int>(points.size());
  journey.status = JourneyStatus::PENDING;
  journey.created_at = now;
  journey.updated_at = now;
  if (!points.empty()) {
    journey.start_latitude = points.front().latitude;
    journey.start_longitude = points.front().longitude;
    journey.end_latitude = points.back().latitude;
    journey.end_longitude = points.back().longitude;
  }
  if (gps_based) {
    journey.place_departure = gps_place(points.front());
    journey.place_arrival = gps_place(points.back());
  }

  GpsLogEvent event = make_log(GpsLogType::TRIP_END_CONFIRMED);
  event.distance_km = distance_km;
  event.gps_points = journey.gps_points_count;
  event.is_gps_based = gps_based;
  event.detail = transport_to_string(journey.detected_transport_type);

  stats_.trips_completed++;
  session_.reset();

  if (trip_callback_)
    trip_callback_(journey);

  transition(TripState::IDLE, now);
  emit_log(event);
}

void TripStateMachine::on_gps_fix(const GpsFix &fix) {
  if (!session_ || (state_ != TripState::ACTIVE_TRIP &&
                    state_ != TripState::CANDIDATE_STILL)) {
    stats_.fixes_ignored++;
    return;
  }

  TripSession &s = *session_;
  if (fix.observed_at_millis < s.started_at_millis) {
    stats_.fixes_ignored++;
    LOG_DEBUG(logger_, "fix at {} predates trip start, ignored",
              fix.observed_at_millis);
    return;
  }

  if (!estimator::is_fix_accepted(fix, config_.accuracy_threshold_m)) {
    s.rejected_fix_count++;
    stats_.fixes_rejected++;
    GpsLogEvent event = make_log(GpsLogType::GPS_REJECTED);
    event.latitude = fix.latitude;
    event.longitude = fix.longitude;
    event.accuracy_m = fix.horizontal_accuracy_meters;
    emit_log(event);
    return;
  }

  auto &points = s.accepted_gps_points;
  auto pos = std::upper_bound(points.begin(), points.end(), fix,
                              [](const GpsFix &a, const GpsFix &b) {
                                return a.observed_at_millis <
                                       b.observed_at_millis;
                              });
  bool appended = pos == points.end();
  points.insert(pos, fix);
  stats_.fixes_accepted++;

  DistanceParams params{config_.accuracy_threshold_m, config_.max_gps_gap_s};
  if (appended && points.size() >= 2) {
    const GpsFix &prev = points[points.size() - 2];
    double gap_s = (fix.observed_at_millis - prev.observed_at_millis) / 1000.0;
    if (gap_s <= params.max_gap_s)
      s.running_distance_km += estimator::haversine_km(prev, fix);
  } else if (!appended) {
    s.running_distance_km = estimator::accumulate_distance(points, params);
  }

  GpsLogEvent event = make_log(GpsLogType::GPS_UPDATE);
  event.latitude = fix.latitude;
  event.longitude = fix.longitude;
  event.accuracy_m = fix.horizontal_accuracy_meters;
  event.distance_km = s.running_distance_km;
  event.gps_points = static_cast<int>(points.size());
  emit_log(event);
}

void TripStateMachine::on_location_error(const std::string &message) {
  LOG_WARN(logger_, "location error: {}", message);
  if (session_ && session_->location_available) {
    session_->location_available = false;
    LOG_WARN(logger_, "trip #{} continues with estimated distance",
             session_->id);
  }
  GpsLogEvent event = make_log(GpsLogType::GPS_ERROR);
  event.detail = message;
  emit_log(event);
}

void TripStateMachine::reset() {
  if (state_ == TripState::IDLE && !session_ && !candidate_) {
    active_moving_.clear();
    last_observation_.reset();
    return;
  }

  if (session_) {
    LOG_INFO(logger_, "abandoning trip #{}", session_->id);
    stop_location();
  }
  candidate_.reset();
  session_.reset();
  active_moving_.clear();
  last_observation_.reset();
  transition(TripState::IDLE, clock_->now_ms());
}

void TripStateMachine::stop_location() {
  if (location_ && location_->tracking())
    location_->stop_tracking();
}

void TripStateMachine::transition(TripState to, int64_t timestamp_ms) {
  scheduler_.cancel(timer_);
  timer_ = kInvalidTimer;
  token_++;

  TripState from = state_;
  state_ = to;
  LOG_INFO(logger_, "{} -> {}", trip_state_to_string(from),
           trip_state_to_string(to));

  if (state_callback_)
    state_callback_(from, to, timestamp_ms);
}

void TripStateMachine::arm(double debounce_s, int64_t since_ms,
                           void (TripStateMachine::*fn)()) {
  int64_t window_ms = std::llround(debounce_s * 1000.0);
  int64_t elapsed_ms = clock_->now_ms() - since_ms;
  int64_t remaining_ms = std::max<int64_t>(window_ms - elapsed_ms, 0);

  uint64_t token = token_;
  timer_ = scheduler_.schedule(std::chrono::milliseconds(remaining_ms),
                               [this, token, fn]() {
                                 if (token != token_) {
                                   LOG_DEBUG(logger_, "stale timer ignored");
                                   return;
                                 }
                                 timer_ = kInvalidTimer;
                                 (this->*fn)();
                               });
  LOG_DEBUG(logger_, "timer armed for {} ms", remaining_ms);
}

GpsLogEvent TripStateMachine::make_log(GpsLogType type) const {
  GpsLogEvent event;
  event.type = type;
  event.timestamp_ms = clock_->now_ms();
  if (session_)
    event.activity = activity_to_string(session_->candidate_activity);
  else if (candidate_)
    event.activity = activity_to_string(candidate_->activity);
  return event;
}

void TripStateMachine::emit_log(const GpsLogEvent &event) {
  LOG_DEBUG(logger_, "gps log: {} {}", GpsLogEvent::type_to_string(event.type),
            event.detail);
  if (log_callback_)
    log_callback_(event);
}

} // namespace tripsense
