#include "network/journey_payload.h"
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tripsense {

namespace {

void write_optional(std::ostringstream &oss, const char *key,
                    const std::optional<double> &value) {
  oss << ",\"" << key << "\":";
  if (value)
    oss << *value;
  else
    oss << "null";
}

} // namespace

std::string format_iso8601_utc(int64_t epoch_ms) {
  int64_t secs = epoch_ms / 1000;
  int64_t millis = epoch_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    secs -= 1;
  }

  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::string json_escape(const std::string &s) {
  std::ostringstream oss;
  for (unsigned char c : s) {
    switch (c) {
    case '"':
      oss << "\\\"";
      break;
    case '\\':
      oss << "\\\\";
      break;
    case '\n':
      oss << "\\n";
      break;
    case '\r':
      oss << "\\r";
      break;
    case '\t':
      oss << "\\t";
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        oss << buf;
      } else {
        oss << c;
      }
    }
  }
  return oss.str();
}

std::string JourneySubmission::to_json() const {
  std::ostringstream oss;
  oss << "{\"place_departure\":\"" << json_escape(place_departure)
      << "\",\"place_arrival\":\"" << json_escape(place_arrival)
      << "\",\"time_departure\":\"" << format_iso8601_utc(time_departure_ms)
      << "\",\"time_arrival\":\"" << format_iso8601_utc(time_arrival_ms)
      << "\",\"distance_km\":" << distance_km << ",\"transport_type\":\""
      << transport_to_string(transport_type) << "\",\"detection_source\":\""
      << source_to_string(detection_source) << "\"}";
  return oss.str();
}

JourneySubmission make_submission(const LocalJourney &journey,
                                  DetectionSource source) {
  JourneySubmission s;
  s.place_departure = journey.place_departure;
  s.place_arrival = journey.place_arrival;
  s.time_departure_ms = journey.time_departure;
  s.time_arrival_ms = journey.time_arrival;
  s.distance_km = journey.distance_km;
  s.transport_type = journey.detected_transport_type;
  s.detection_source = source;
  return s;
}

std::string journey_to_json(const LocalJourney &j) {
  std::ostringstream oss;
  oss << "{\"id\":" << j.id << ",\"time_departure\":" << j.time_departure
      << ",\"time_arrival\":" << j.time_arrival
      << ",\"duration_minutes\":" << j.duration_minutes
      << ",\"distance_km\":" << j.distance_km
      << ",\"detected_transport_type\":\""
      << transport_to_string(j.detected_transport_type)
      << "\",\"confidence_avg\":" << j.confidence_avg
      << ",\"place_departure\":\"" << json_escape(j.place_departure)
      << "\",\"place_arrival\":\"" << json_escape(j.place_arrival) << "\"";
  write_optional(oss, "start_latitude", j.start_latitude);
  write_optional(oss, "start_longitude", j.start_longitude);
  write_optional(oss, "end_latitude", j.end_latitude);
  write_optional(oss, "end_longitude", j.end_longitude);
  oss << ",\"is_gps_based_distance\":"
      << (j.is_gps_based_distance ? "true" : "false")
      << ",\"gps_points_count\":" << j.gps_points_count << ",\"status\":\""
      << status_to_string(j.status) << "\",\"created_at\":" << j.created_at
      << ",\"updated_at\":" << j.updated_at << "}";
  return oss.str();
}

} // namespace tripsense
