#pragma once

#include "capture/activity_stream.h"
#include "capture/host_sources.h"
#include "capture/location_stream.h"
#include "common/clock.h"
#include "common/detection_config.h"
#include "common/logger.h"
#include "common/signal.h"
#include "detection/event_loop.h"
#include "detection/trip_state_machine.h"
#include "services/service_manager.h"
#include "storage/journey_store.h"
#include "storage/journey_writer.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tripsense {

enum class StartMode { FULL, DEGRADED };

inline const char *start_mode_to_string(StartMode mode) {
  return mode == StartMode::FULL ? "full" : "degraded";
}

struct DetectionStateEvent {
  bool running{false};
  TripState trip_state{TripState::IDLE};
  bool debug_mode{false};
  int64_t timestamp_ms{0};
};

// Facade for the UI layer. Owns the event loop, the state machine and the
// persistence worker; the host sources and the store are injected.
class DetectionController {
public:
  DetectionController(const DetectionConfig &config,
                      std::shared_ptr<JourneyStore> store,
                      std::shared_ptr<ActivityRecognitionSource> activity_source,
                      std::shared_ptr<LocationSource> location_source,
                      std::shared_ptr<PermissionProvider> permissions,
                      std::shared_ptr<Clock> clock);
  ~DetectionController();

  DetectionController(const DetectionController &) = delete;
  DetectionController &operator=(const DetectionController &) = delete;

  PermissionStatus check_permissions();
  PermissionStatus request_permissions();

  // Throws PermissionDenied or AdapterUnavailable. A no-op when running.
  StartMode start();
  // Cancels timers, abandons the in-flight session and flushes pending
  // writes. Completed journeys are never discarded.
  void stop();
  bool is_running() const { return running_; }
  TripState current_state() const { return trip_state_; }

  std::vector<LocalJourney> get_pending_journeys();
  std::vector<LocalJourney> get_all_journeys();
  std::optional<LocalJourney> get_journey(int64_t id);
  bool update_journey(int64_t id, const JourneyUpdate &fields);
  bool delete_journey(int64_t id);
  bool mark_journey_sent(int64_t id);
  int get_pending_count();

  void set_debug_mode(bool enabled);
  bool debug_mode() const { return debug_mode_; }

  // Inserts a plausible journey straight into the store.
  LocalJourney simulate_trip();

  SubscriptionId on_trip_detected(std::function<void(const LocalJourney &)> h);
  SubscriptionId
  on_state_changed(std::function<void(const DetectionStateEvent &)> h);
  SubscriptionId
  on_transition(std::function<void(const ActivityObservation &)> h);
  SubscriptionId on_gps_log(std::function<void(const GpsLogEvent &)> h);
  bool unsubscribe(SubscriptionId id);

  // Waits for queued events and pending journey writes.
  bool flush(std::chrono::milliseconds timeout);

private:
  void wire_adapters();
  void emit_state();

  DetectionConfig config_;
  std::shared_ptr<JourneyStore> store_;
  std::shared_ptr<PermissionProvider> permissions_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<spdlog::logger> logger_;

  std::shared_ptr<ActivityStream> activity_;
  std::shared_ptr<LocationStream> location_;
  std::shared_ptr<EventLoop> loop_;
  std::shared_ptr<JourneyWriter> writer_;
  std::unique_ptr<TripStateMachine> state_machine_;
  ServiceManager services_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<TripState> trip_state_{TripState::IDLE};
  std::optional<StartMode> mode_;

  std::atomic<bool> debug_mode_{false};
  std::string saved_level_;

  Signal<const LocalJourney &> trip_detected_;
  Signal<const DetectionStateEvent &> state_changed_;
  Signal<const ActivityObservation &> transition_;
  Signal<const GpsLogEvent &> gps_log_;
};

} // namespace tripsense
