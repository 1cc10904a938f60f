#include "detection/detection_controller.h"

namespace tripsense {

namespace {
constexpr auto kStopFlushTimeout = std::chrono::seconds(5);
}

DetectionController::DetectionController(
    const DetectionConfig &config, std::shared_ptr<JourneyStore> store,
    std::shared_ptr<ActivityRecognitionSource> activity_source,
    std::shared_ptr<LocationSource> location_source,
    std::shared_ptr<PermissionProvider> permissions,
    std::shared_ptr<Clock> clock)
    : config_(config), store_(std::move(store)),
      permissions_(std::move(permissions)), clock_(std::move(clock)),
      logger_(Logger::get("controller")) {
  activity_ = std::make_shared<ActivityStream>(std::move(activity_source),
                                               config_.default_confidence);
  location_ = std::make_shared<LocationStream>(
      std::move(location_source),
      std::chrono::milliseconds(config_.location_interval_ms));
  loop_ = std::make_shared<EventLoop>(clock_);
  writer_ = std::make_shared<JourneyWriter>(
      store_, std::chrono::milliseconds(config_.writer_retry_initial_ms),
      std::chrono::milliseconds(config_.writer_retry_max_ms));

  // writer first so the loop never hands a journey to a stopped worker
  services_.add(writer_);
  services_.add(loop_);
  services_.add(activity_);

  wire_adapters();
}

DetectionController::~DetectionController() {
  if (running_) {
    stop();
  }
}

void DetectionController::wire_adapters() {
  activity_->set_callback([this](const ActivityObservation &obs) {
    if (transition_.emit(obs) > 0)
      LOG_WARN(logger_, "transition subscriber threw");
    loop_->post([this, obs] {
      if (state_machine_)
        state_machine_->on_activity(obs);
    });
  });

  location_->set_callback([this](const GpsFix &fix) {
    loop_->post([this, fix] {
      if (state_machine_)
        state_machine_->on_gps_fix(fix);
    });
  });

  location_->set_error_callback([this](const std::string &message) {
    loop_->post([this, message] {
      if (state_machine_)
        state_machine_->on_location_error(message);
    });
  });

  writer_->set_callback([this](const LocalJourney &journey) {
    LOG_INFO(logger_, "trip detected: journey {} ({}, {:.2f} km, {} min)",
             journey.id, transport_to_string(journey.detected_transport_type),
             journey.distance_km, journey.duration_minutes);
    if (trip_detected_.emit(journey) > 0)
      LOG_WARN(logger_, "trip subscriber threw for journey {}", journey.id);
  });
}

PermissionStatus DetectionController::check_permissions() {
  if (!permissions_) {
    return PermissionStatus{true, true, true, true};
  }
  return permissions_->check();
}

PermissionStatus DetectionController::request_permissions() {
  if (!permissions_) {
    return PermissionStatus{true, true, true, true};
  }
  return permissions_->request();
}

StartMode DetectionController::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_ && mode_) {
    return *mode_;
  }

  PermissionStatus status = check_permissions();
  if (!status.activity_recognition) {
    LOG_ERROR(logger_, "activity recognition permission not granted");
    throw PermissionDenied("activity recognition permission not granted",
                           status);
  }

  StartMode mode = StartMode::FULL;
  if (!status.location) {
    if (!config_.allow_degraded_start) {
      LOG_ERROR(logger_, "location permission not granted");
      throw PermissionDenied("location permission not granted", status);
    }
    LOG_WARN(logger_, "location permission not granted, starting degraded "
                      "(distance will be estimated)");
    mode = StartMode::DEGRADED;
  }

  if (!location_->init()) {
    LOG_WARN(logger_, "location adapter failed to initialize");
  }

  std::shared_ptr<LocationControl> location;
  if (mode == StartMode::FULL)
    location = location_;

  state_machine_ = std::make_unique<TripStateMachine>(config_, clock_, *loop_,
                                                      location);
  state_machine_->set_state_callback(
      [this](TripState, TripState to, int64_t) {
        trip_state_ = to;
        emit_state();
      });
  state_machine_->set_trip_callback(
      [this](const LocalJourney &journey) { writer_->submit(journey); });
  state_machine_->set_log_callback(
      [this](const GpsLogEvent &event) {
        if (gps_log_.emit(event) > 0)
          LOG_WARN(logger_, "gps log subscriber threw on {}",
                   GpsLogEvent::type_to_string(event.type));
      });
  trip_state_ = TripState::IDLE;

  if (!services_.init_all() || !services_.start_all()) {
    state_machine_.reset();
    LOG_ERROR(logger_, "detection could not start, will retry on next start");
    throw AdapterUnavailable("activity recognition could not be registered");
  }

  mode_ = mode;
  running_ = true;
  LOG_INFO(logger_, "detection started ({})", start_mode_to_string(mode));
  emit_state();
  return mode;
}

void DetectionController::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_) {
    return;
  }

  LOG_INFO(logger_, "stopping detection");
  if (!activity_->stop()) {
    LOG_WARN(logger_, "activity adapter did not stop cleanly");
  }

  // runs before the loop exits; stop() drains already queued tasks
  loop_->post([this] {
    if (state_machine_)
      state_machine_->reset();
  });
  loop_->stop();
  location_->stop_tracking();
  state_machine_.reset();

  if (!writer_->flush(kStopFlushTimeout)) {
    LOG_WARN(logger_, "pending journey writes did not complete in time");
  }
  if (!writer_->stop()) {
    LOG_ERROR(logger_, "{} journey(s) held in memory", writer_->pending());
  }

  running_ = false;
  mode_.reset();
  trip_state_ = TripState::IDLE;
  LOG_INFO(logger_, "detection stopped");
  emit_state();
}

std::vector<LocalJourney> DetectionController::get_pending_journeys() {
  return store_->list_pending();
}

std::vector<LocalJourney> DetectionController::get_all_journeys() {
  return store_->list_all();
}

std::optional<LocalJourney> DetectionController::get_journey(int64_t id) {
  return store_->get(id);
}

bool DetectionController::update_journey(int64_t id,
                                         const JourneyUpdate &fields) {
  return store_->update(id, fields);
}

bool DetectionController::delete_journey(int64_t id) {
  return store_->remove(id);
}

bool DetectionController::mark_journey_sent(int64_t id) {
  return store_->mark_sent(id);
}

int DetectionController::get_pending_count() { return store_->count_pending(); }

void DetectionController::set_debug_mode(bool enabled) {
  if (enabled == debug_mode_) {
    return;
  }
  if (enabled) {
    saved_level_ = Logger::level();
    Logger::set_level("debug");
  } else {
    Logger::set_level(saved_level_.empty() ? "info" : saved_level_);
  }
  debug_mode_ = enabled;
  LOG_INFO(logger_, "debug mode {}", enabled ? "enabled" : "disabled");
  emit_state();
}

LocalJourney DetectionController::simulate_trip() {
  int64_t now = clock_->now_ms();

  LocalJourney journey;
  journey.time_departure = now - 10 * 60 * 1000;
  journey.time_arrival = now;
  journey.duration_minutes = 10;
  journey.distance_km = 0.8;
  journey.detected_transport_type = TransportType::MARCHE;
  journey.confidence_avg = 80;
  journey.place_departure = "DEBUG: Simulated";
  journey.place_arrival = "DEBUG: Simulated";

  int64_t id = store_->insert(journey);
  auto saved = store_->get(id);
  if (!saved) {
    throw PersistenceFailure("simulated journey missing after insert");
  }
  LOG_INFO(logger_, "simulated journey {} inserted", id);
  if (trip_detected_.emit(*saved) > 0)
    LOG_WARN(logger_, "trip subscriber threw for journey {}", id);
  return *saved;
}

SubscriptionId DetectionController::on_trip_detected(
    std::function<void(const LocalJourney &)> h) {
  return trip_detected_.subscribe(std::move(h));
}

SubscriptionId DetectionController::on_state_changed(
    std::function<void(const DetectionStateEvent &)> h) {
  return state_changed_.subscribe(std::move(h));
}

SubscriptionId DetectionController::on_transition(
    std::function<void(const ActivityObservation &)> h) {
  return transition_.subscribe(std::move(h));
}

SubscriptionId
DetectionController::on_gps_log(std::function<void(const GpsLogEvent &)> h) {
  return gps_log_.subscribe(std::move(h));
}

bool DetectionController::unsubscribe(SubscriptionId id) {
  return trip_detected_.unsubscribe(id) || state_changed_.unsubscribe(id) ||
         transition_.unsubscribe(id) || gps_log_.unsubscribe(id);
}

bool DetectionController::flush(std::chrono::milliseconds timeout) {
  if (running_ && !loop_->flush(timeout)) {
    return false;
  }
  return writer_->flush(timeout);
}

void DetectionController::emit_state() {
  DetectionStateEvent event;
  event.running = running_;
  event.trip_state = trip_state_;
  event.debug_mode = debug_mode_;
  event.timestamp_ms = clock_->now_ms();
  if (state_changed_.emit(event) > 0)
    LOG_WARN(logger_, "state subscriber threw");
}

} // namespace tripsense
