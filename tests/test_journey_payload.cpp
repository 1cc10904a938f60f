#include "network/journey_payload.h"
#include <gtest/gtest.h>

using namespace tripsense;

namespace {

LocalJourney sample_journey() {
  LocalJourney j;
  j.id = 7;
  j.time_departure = 1709280930250;
  j.time_arrival = 1709281830250;
  j.duration_minutes = 15;
  j.distance_km = 1.25;
  j.detected_transport_type = TransportType::VELO;
  j.confidence_avg = 82;
  j.place_departure = "GPS: (48.8566, 2.3522)";
  j.place_arrival = "GPS: (48.8606, 2.3376)";
  j.start_latitude = 48.8566;
  j.start_longitude = 2.3522;
  j.end_latitude = 48.8606;
  j.end_longitude = 2.3376;
  j.is_gps_based_distance = true;
  j.gps_points_count = 42;
  j.created_at = 1709281830300;
  j.updated_at = 1709281830300;
  return j;
}

} // namespace

TEST(JourneyPayloadTest, FormatsUtcTimestampsWithMillis) {
  EXPECT_EQ(format_iso8601_utc(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(format_iso8601_utc(1709280930250), "2024-03-01T08:15:30.250Z");
  EXPECT_EQ(format_iso8601_utc(1709280930005), "2024-03-01T08:15:30.005Z");
}

TEST(JourneyPayloadTest, SubmissionCarriesCorrectedFields) {
  auto submission = make_submission(sample_journey(), DetectionSource::AUTO);
  EXPECT_EQ(submission.place_departure, "GPS: (48.8566, 2.3522)");
  EXPECT_EQ(submission.time_departure_ms, 1709280930250);
  EXPECT_EQ(submission.transport_type, TransportType::VELO);

  std::string json = submission.to_json();
  EXPECT_NE(json.find("\"time_departure\":\"2024-03-01T08:15:30.250Z\""),
            std::string::npos);
  EXPECT_NE(json.find("\"time_arrival\":\"2024-03-01T08:30:30.250Z\""),
            std::string::npos);
  EXPECT_NE(json.find("\"distance_km\":1.25"), std::string::npos);
  EXPECT_NE(json.find("\"transport_type\":\"velo\""), std::string::npos);
  EXPECT_NE(json.find("\"detection_source\":\"auto\""), std::string::npos);
}

TEST(JourneyPayloadTest, ManualSourceIsLabelled) {
  auto submission = make_submission(sample_journey(), DetectionSource::MANUAL);
  EXPECT_NE(submission.to_json().find("\"detection_source\":\"manual\""),
            std::string::npos);
}

TEST(JourneyPayloadTest, EscapesPlaceNames) {
  EXPECT_EQ(json_escape("plain"), "plain");
  EXPECT_EQ(json_escape("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
  EXPECT_EQ(json_escape("line\nbreak\t"), "line\\nbreak\\t");
  EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
  // multibyte UTF-8 passes through
  EXPECT_EQ(json_escape("Gare de l'Est \xC3\xA9"), "Gare de l'Est \xC3\xA9");
}

TEST(JourneyPayloadTest, FullRecordIncludesEveryField) {
  std::string json = journey_to_json(sample_journey());
  EXPECT_EQ(json.front(), '{');
  EXPECT_EQ(json.back(), '}');
  EXPECT_NE(json.find("\"id\":7"), std::string::npos);
  EXPECT_NE(json.find("\"duration_minutes\":15"), std::string::npos);
  EXPECT_NE(json.find("\"detected_transport_type\":\"velo\""),
            std::string::npos);
  EXPECT_NE(json.find("\"confidence_avg\":82"), std::string::npos);
  EXPECT_NE(json.find("\"start_latitude\":48.8566"), std::string::npos);
  EXPECT_NE(json.find("\"is_gps_based_distance\":true"), std::string::npos);
  EXPECT_NE(json.find("\"gps_points_count\":42"), std::string::npos);
  EXPECT_NE(json.find("\"status\":\"PENDING\""), std::string::npos);
}

TEST(JourneyPayloadTest, MissingCoordinatesAreNull) {
  LocalJourney j = sample_journey();
  j.start_latitude.reset();
  j.start_longitude.reset();
  j.end_latitude.reset();
  j.end_longitude.reset();
  j.is_gps_based_distance = false;
  j.status = JourneyStatus::SENT;

  std::string json = journey_to_json(j);
  EXPECT_NE(json.find("\"start_latitude\":null"), std::string::npos);
  EXPECT_NE(json.find("\"end_longitude\":null"), std::string::npos);
  EXPECT_NE(json.find("\"is_gps_based_distance\":false"), std::string::npos);
  EXPECT_NE(json.find("\"status\":\"SENT\""), std::string::npos);
}
