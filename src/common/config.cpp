#include "common/config.h"
#include "common/errors.h"
#include <string>

namespace tripsense {

Config &Config::instance() {
  static Config cfg;
  return cfg;
}

void Config::load(const std::string &path) {
  try {
    root_ = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Failed to load config: " + std::string(e.what()));
  }
}

void Config::load_string(const std::string &yaml) {
  try {
    root_ = YAML::Load(yaml);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Failed to parse config: " + std::string(e.what()));
  }
}

std::string Config::system_value(const std::string &key,
                                 const std::string &fallback) const {
  if (const YAML::Node system = root_["system"])
    return system[key].as<std::string>(fallback);
  return fallback;
}

std::string Config::system_name() const {
  return system_value("name", "tripsense");
}

std::string Config::log_level() const {
  return system_value("log_level", "info");
}

std::string Config::log_dir() const {
  return system_value("log_dir", "/tmp/tripsense/logs");
}

std::string Config::data_dir() const {
  return system_value("data_dir", "/tmp/tripsense/data");
}

namespace {

// A present key must convert; as<T>(fallback) would silently hide typos.
template <typename T>
void read(const YAML::Node &node, const char *key, T &value) {
  const YAML::Node child = node[key];
  if (!child)
    return;
  try {
    value = child.as<T>();
  } catch (const YAML::Exception &e) {
    throw ConfigError("Invalid detection config '" + std::string(key) +
                      "': " + std::string(e.what()));
  }
}

void require(bool ok, const std::string &what) {
  if (!ok)
    throw ConfigError("Invalid detection config: " + what);
}

} // namespace

DetectionConfig Config::detection() const {
  DetectionConfig cfg;
  const YAML::Node det = root_["detection"];
  if (!det)
    return cfg;

  read(det, "moving_debounce_s", cfg.moving_debounce_s);
  read(det, "stop_debounce_s", cfg.stop_debounce_s);
  read(det, "min_trip_duration_min", cfg.min_trip_duration_min);
  read(det, "min_trip_distance_km", cfg.min_trip_distance_km);
  read(det, "accuracy_threshold_m", cfg.accuracy_threshold_m);
  read(det, "min_gps_points", cfg.min_gps_points);
  read(det, "max_gps_gap_s", cfg.max_gps_gap_s);
  read(det, "default_confidence", cfg.default_confidence);
  read(det, "location_interval_ms", cfg.location_interval_ms);
  read(det, "allow_degraded_start", cfg.allow_degraded_start);

  if (const YAML::Node speeds = det["speeds_kmh"]) {
    read(speeds, "walking", cfg.speeds.walking_kmh);
    read(speeds, "running", cfg.speeds.running_kmh);
    read(speeds, "cycling", cfg.speeds.cycling_kmh);
    read(speeds, "vehicle", cfg.speeds.vehicle_kmh);
  }

  if (const YAML::Node writer = det["writer"]) {
    read(writer, "retry_initial_ms", cfg.writer_retry_initial_ms);
    read(writer, "retry_max_ms", cfg.writer_retry_max_ms);
  }

  require(cfg.moving_debounce_s >= 0 && cfg.stop_debounce_s >= 0,
          "debounce windows must not be negative");
  require(cfg.min_trip_duration_min >= 0 && cfg.min_trip_distance_km >= 0,
          "trip thresholds must not be negative");
  require(cfg.accuracy_threshold_m > 0, "accuracy_threshold_m must be > 0");
  require(cfg.min_gps_points >= 1, "min_gps_points must be >= 1");
  require(cfg.max_gps_gap_s > 0, "max_gps_gap_s must be > 0");
  require(cfg.default_confidence >= 0 && cfg.default_confidence <= 100,
          "default_confidence must be within 0-100");
  require(cfg.location_interval_ms > 0, "location_interval_ms must be > 0");
  require(cfg.speeds.walking_kmh > 0 && cfg.speeds.running_kmh > 0 &&
              cfg.speeds.cycling_kmh > 0 && cfg.speeds.vehicle_kmh > 0,
          "speeds_kmh must be positive");
  require(cfg.writer_retry_initial_ms > 0 &&
              cfg.writer_retry_max_ms >= cfg.writer_retry_initial_ms,
          "writer retry delays must be positive and ordered");

  return cfg;
}

} // namespace tripsense
