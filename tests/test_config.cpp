#include "common/config.h"
#include "common/errors.h"
#include <gtest/gtest.h>

using namespace tripsense;

class ConfigTest : public ::testing::Test {
protected:
  void TearDown() override { Config::instance().load_string("{}"); }
};

TEST_F(ConfigTest, EmptyDocumentUsesDefaults) {
  auto &cfg = Config::instance();
  cfg.load_string("{}");

  EXPECT_EQ(cfg.system_name(), "tripsense");
  EXPECT_EQ(cfg.log_level(), "info");

  DetectionConfig det = cfg.detection();
  EXPECT_DOUBLE_EQ(det.moving_debounce_s, 10.0);
  EXPECT_DOUBLE_EQ(det.stop_debounce_s, 60.0);
  EXPECT_EQ(det.min_trip_duration_min, 3);
  EXPECT_DOUBLE_EQ(det.min_trip_distance_km, 0.3);
  EXPECT_DOUBLE_EQ(det.accuracy_threshold_m, 50.0);
  EXPECT_EQ(det.min_gps_points, 3);
  EXPECT_EQ(det.default_confidence, 75);
  EXPECT_TRUE(det.allow_degraded_start);
}

TEST_F(ConfigTest, PartialDetectionSectionOverridesOnlyGivenKeys) {
  auto &cfg = Config::instance();
  cfg.load_string("system:\n"
                  "  name: tripsense-test\n"
                  "  log_level: debug\n"
                  "  data_dir: /var/lib/tripsense\n"
                  "detection:\n"
                  "  stop_debounce_s: 15\n"
                  "  min_gps_points: 5\n"
                  "  allow_degraded_start: false\n"
                  "  speeds_kmh:\n"
                  "    cycling: 18.5\n"
                  "  writer:\n"
                  "    retry_max_ms: 60000\n");

  EXPECT_EQ(cfg.system_name(), "tripsense-test");
  EXPECT_EQ(cfg.log_level(), "debug");
  EXPECT_EQ(cfg.data_dir(), "/var/lib/tripsense");
  EXPECT_EQ(cfg.log_dir(), "/tmp/tripsense/logs");

  DetectionConfig det = cfg.detection();
  EXPECT_DOUBLE_EQ(det.stop_debounce_s, 15.0);
  EXPECT_DOUBLE_EQ(det.moving_debounce_s, 10.0);
  EXPECT_EQ(det.min_gps_points, 5);
  EXPECT_FALSE(det.allow_degraded_start);
  EXPECT_DOUBLE_EQ(det.speeds.cycling_kmh, 18.5);
  EXPECT_DOUBLE_EQ(det.speeds.walking_kmh, 5.0);
  EXPECT_EQ(det.writer_retry_max_ms, 60000);
  EXPECT_EQ(det.writer_retry_initial_ms, 500);
}

TEST_F(ConfigTest, MalformedYamlThrows) {
  EXPECT_THROW(Config::instance().load_string("detection: [unclosed"),
               ConfigError);
}

TEST_F(ConfigTest, MissingFileThrows) {
  EXPECT_THROW(Config::instance().load("/nonexistent/tripsense.yaml"),
               ConfigError);
}

TEST_F(ConfigTest, UnparseableValueThrows) {
  auto &cfg = Config::instance();
  cfg.load_string("detection:\n  stop_debounce_s: soon\n");
  EXPECT_THROW(cfg.detection(), ConfigError);
}

TEST_F(ConfigTest, OutOfRangeValueThrows) {
  auto &cfg = Config::instance();
  cfg.load_string("detection:\n  default_confidence: 150\n");
  EXPECT_THROW(cfg.detection(), ConfigError);

  cfg.load_string("detection:\n  min_gps_points: 0\n");
  EXPECT_THROW(cfg.detection(), ConfigError);

  cfg.load_string("detection:\n  moving_debounce_s: -1\n");
  EXPECT_THROW(cfg.detection(), ConfigError);
}
