#pragma once

#include "capture/location_control.h"
#include "capture/observation.h"
#include "common/clock.h"
#include "common/detection_config.h"
#include "common/logger.h"
#include "detection/timer_scheduler.h"
#include "detection/trip_types.h"
#include "storage/local_journey.h"
#include <functional>
#include <memory>
#include <optional>
#include <set>

namespace tripsense {

// Owns the trip lifecycle. Not thread safe: every method, including the
// timer callbacks it schedules, must run in one serialized context (the
// controller's EventLoop, or a ManualScheduler in tests).
class TripStateMachine {
public:
  using StateCallback =
      std::function<void(TripState from, TripState to, int64_t timestamp_ms)>;
  using TripCallback = std::function<void(const LocalJourney &)>;
  using LogCallback = std::function<void(const GpsLogEvent &)>;

  TripStateMachine(const DetectionConfig &config, std::shared_ptr<Clock> clock,
                   TimerScheduler &scheduler,
                   std::shared_ptr<LocationControl> location);
  ~TripStateMachine();

  void on_activity(const ActivityObservation &obs);
  void on_gps_fix(const GpsFix &fix);
  // Keeps the session; its distance is estimated from then on.
  void on_location_error(const std::string &message);

  // Abandons any candidate or session without producing a journey.
  void reset();

  TripState state() const { return state_; }
  const std::optional<TripSession> &session() const { return session_; }
  size_t active_moving_count() const { return active_moving_.size(); }

  void set_state_callback(StateCallback cb) { state_callback_ = std::move(cb); }
  void set_trip_callback(TripCallback cb) { trip_callback_ = std::move(cb); }
  void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

  struct Stats {
    uint64_t sessions_opened{0};
    uint64_t trips_completed{0};
    uint64_t trips_discarded{0};
    uint64_t candidates_cancelled{0};
    uint64_t fixes_accepted{0};
    uint64_t fixes_rejected{0};
    uint64_t fixes_ignored{0};
    uint64_t duplicates{0};
  };
  const Stats &get_stats() const { return stats_; }

private:
  struct MovingCandidate {
    int64_t since_ms;
    ActivityType activity;
    std::vector<ActivitySample> samples;
  };

  int64_t event_time_ms(const ActivityObservation &obs);
  // Returns false when the observation has no effect on the moving set.
  bool track_moving(const ActivityObservation &obs);

  void begin_candidate(const ActivityObservation &obs, int64_t t);
  void cancel_candidate(int64_t t);
  void on_moving_confirmed();

  void begin_stop(int64_t t);
  void resume_trip(const ActivityObservation &obs, int64_t t);
  void on_stop_confirmed();
  void close_session();

  void add_sample(const ActivityObservation &obs);
  void stop_location();

  void transition(TripState to, int64_t timestamp_ms);
  void arm(double debounce_s, int64_t since_ms, void (TripStateMachine::*fn)());

  GpsLogEvent make_log(GpsLogType type) const;
  void emit_log(const GpsLogEvent &event);

  DetectionConfig config_;
  std::shared_ptr<Clock> clock_;
  TimerScheduler &scheduler_;
  std::shared_ptr<LocationControl> location_;
  std::shared_ptr<spdlog::logger> logger_;

  TripState state_{TripState::IDLE};
  uint64_t token_{0};
  TimerId timer_{kInvalidTimer};

  std::set<ActivityType> active_moving_;
  std::optional<MovingCandidate> candidate_;
  std::optional<TripSession> session_;
  uint64_t next_session_id_{0};

  std::optional<ActivityObservation> last_observation_;
  int64_t last_event_ms_{0};

  StateCallback state_callback_;
  TripCallback trip_callback_;
  LogCallback log_callback_;

  Stats stats_;
};

} // namespace tripsense
