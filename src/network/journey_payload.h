#pragma once

#include "storage/local_journey.h"
#include <cstdint>
#include <string>

namespace tripsense {

enum class DetectionSource { AUTO, MANUAL };

// Body of a confirmed journey submitted to the scoring backend.
struct JourneySubmission {
  std::string place_departure;
  std::string place_arrival;
  int64_t time_departure_ms{0};
  int64_t time_arrival_ms{0};
  double distance_km{0.0};
  TransportType transport_type{TransportType::MARCHE};
  DetectionSource detection_source{DetectionSource::AUTO};

  static const char *source_to_string(DetectionSource s) {
    return s == DetectionSource::MANUAL ? "manual" : "auto";
  }

  std::string to_json() const;
};

JourneySubmission make_submission(const LocalJourney &journey,
                                  DetectionSource source);

// "2024-03-01T08:15:30.250Z"
std::string format_iso8601_utc(int64_t epoch_ms);

std::string json_escape(const std::string &s);

// Full record, for the CLI and diagnostics.
std::string journey_to_json(const LocalJourney &journey);

} // namespace tripsense
