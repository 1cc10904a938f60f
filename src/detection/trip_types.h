#pragma once

#include "capture/observation.h"
#include "estimation/trip_estimator.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tripsense {

enum class TripState {
  IDLE,
  CANDIDATE_MOVING,
  ACTIVE_TRIP,
  CANDIDATE_STILL,
  CLOSING,
};

inline const char *trip_state_to_string(TripState state) {
  switch (state) {
  case TripState::IDLE:
    return "IDLE";
  case TripState::CANDIDATE_MOVING:
    return "CANDIDATE_MOVING";
  case TripState::ACTIVE_TRIP:
    return "ACTIVE_TRIP";
  case TripState::CANDIDATE_STILL:
    return "CANDIDATE_STILL";
  case TripState::CLOSING:
    return "CLOSING";
  }
  return "UNKNOWN";
}

// Memory-resident only; lost on restart.
struct TripSession {
  uint64_t id{0};
  int64_t started_at_millis{0};
  ActivityType candidate_activity{ActivityType::UNKNOWN};
  std::vector<ActivitySample> confidence_samples;
  std::vector<GpsFix> accepted_gps_points; // sorted by observed_at_millis
  size_t rejected_fix_count{0};
  double running_distance_km{0.0};
  bool location_available{true};
  int64_t still_since_millis{0};
};

enum class DiscardReason { TOO_SHORT, TOO_FEW_KM };

inline const char *discard_reason_to_string(DiscardReason reason) {
  return reason == DiscardReason::TOO_SHORT ? "duration_below_minimum"
                                            : "distance_below_minimum";
}

enum class GpsLogType {
  CONFIRMATION_STARTED,
  CONFIRMATION_CANCELLED,
  GPS_START,
  GPS_UNAVAILABLE,
  GPS_UPDATE,
  GPS_REJECTED,
  GPS_ERROR,
  STOP_PENDING_CONFIRMATION,
  TRIP_RESUMED,
  TRIP_END_CONFIRMED,
  GPS_STATS,
  TRIP_DISCARDED,
};

// Raw diagnostic event for debug tooling.
struct GpsLogEvent {
  GpsLogType type;
  int64_t timestamp_ms{0};
  std::string activity;
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::optional<double> accuracy_m;
  std::optional<double> distance_km;
  std::optional<int> gps_points;
  std::optional<bool> is_gps_based;
  std::string detail;

  static const char *type_to_string(GpsLogType t) {
    switch (t) {
    case GpsLogType::CONFIRMATION_STARTED:
      return "gps_confirmation_started";
    case GpsLogType::CONFIRMATION_CANCELLED:
      return "gps_confirmation_cancelled";
    case GpsLogType::GPS_START:
      return "gps_start";
    case GpsLogType::GPS_UNAVAILABLE:
      return "gps_unavailable";
    case GpsLogType::GPS_UPDATE:
      return "gps_update";
    case GpsLogType::GPS_REJECTED:
      return "gps_rejected";
    case GpsLogType::GPS_ERROR:
      return "gps_error";
    case GpsLogType::STOP_PENDING_CONFIRMATION:
      return "gps_stop_pending_confirmation";
    case GpsLogType::TRIP_RESUMED:
      return "trip_resumed";
    case GpsLogType::TRIP_END_CONFIRMED:
      return "trip_end_confirmed";
    case GpsLogType::GPS_STATS:
      return "gps_stats";
    case GpsLogType::TRIP_DISCARDED:
      return "trip_discarded";
    }
    return "unknown";
  }
};

} // namespace tripsense
