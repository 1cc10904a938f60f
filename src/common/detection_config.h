#pragma once

#include <cstdint>

namespace tripsense {

struct SpeedTable {
  double walking_kmh = 5.0;
  double running_kmh = 10.0;
  double cycling_kmh = 15.0;
  double vehicle_kmh = 30.0;
};

struct DetectionConfig {
  double moving_debounce_s = 10.0;
  double stop_debounce_s = 60.0;

  int min_trip_duration_min = 3;
  double min_trip_distance_km = 0.3;

  double accuracy_threshold_m = 50.0;
  int min_gps_points = 3;
  double max_gps_gap_s = 120.0;

  int default_confidence = 75;
  int64_t location_interval_ms = 5000;
  bool allow_degraded_start = true;

  SpeedTable speeds;

  int64_t writer_retry_initial_ms = 500;
  int64_t writer_retry_max_ms = 30000;
};

} // namespace tripsense
