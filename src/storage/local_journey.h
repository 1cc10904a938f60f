#pragma once

#include "estimation/transport_type.h"
#include <cstdint>
#include <optional>
#include <string>

namespace tripsense {

enum class JourneyStatus { PENDING, SENT };

inline const char *status_to_string(JourneyStatus status) {
  return status == JourneyStatus::SENT ? "SENT" : "PENDING";
}

inline std::optional<JourneyStatus> status_from_string(const std::string &s) {
  if (s == "PENDING")
    return JourneyStatus::PENDING;
  if (s == "SENT")
    return JourneyStatus::SENT;
  return std::nullopt;
}

struct LocalJourney {
  int64_t id{0};
  int64_t time_departure{0}; // epoch ms
  int64_t time_arrival{0};
  int duration_minutes{0};
  double distance_km{0.0};
  TransportType detected_transport_type{TransportType::MARCHE};
  int confidence_avg{0};
  std::string place_departure{"Auto-detected"};
  std::string place_arrival{"Unknown"};
  std::optional<double> start_latitude;
  std::optional<double> start_longitude;
  std::optional<double> end_latitude;
  std::optional<double> end_longitude;
  bool is_gps_based_distance{false};
  int gps_points_count{0};
  JourneyStatus status{JourneyStatus::PENDING};
  int64_t created_at{0};
  int64_t updated_at{0};
};

// Fields the review UI may correct before submission.
struct JourneyUpdate {
  std::optional<TransportType> transport_type;
  std::optional<double> distance_km;
  std::optional<std::string> place_departure;
  std::optional<std::string> place_arrival;

  bool empty() const {
    return !transport_type && !distance_km && !place_departure &&
           !place_arrival;
  }
};

} // namespace tripsense
