#pragma once

#include "capture/observation.h"
#include "common/detection_config.h"
#include "estimation/transport_type.h"
#include <vector>

namespace tripsense {

struct ActivitySample {
  ActivityType activity_type;
  int confidence;
};

struct DistanceParams {
  double accuracy_threshold_m = 50.0;
  double max_gap_s = 120.0;
};

struct Classification {
  TransportType transport_type{TransportType::MARCHE};
  int confidence_avg{0};
  ActivityType dominant_activity{ActivityType::UNKNOWN};
};

enum class GpsQuality { EXCELLENT, GOOD, DEGRADED, LOST };

struct GpsQualityReport {
  size_t accepted{0};
  size_t rejected{0};
  double acceptance_ratio{0.0};
  double mean_accuracy_m{0.0};
  GpsQuality quality{GpsQuality::LOST};
};

const char *gps_quality_to_string(GpsQuality quality);

namespace estimator {

constexpr double kEarthRadiusKm = 6371.0;

double haversine_km(const GpsFix &a, const GpsFix &b);

bool is_fix_accepted(const GpsFix &fix, double accuracy_threshold_m);

// Stable sort on observed_at_millis.
void sort_by_time(std::vector<GpsFix> &points);

// Sums consecutive pairs in the given order. Fixes over the accuracy
// threshold are skipped; pairs further apart than max_gap_s add nothing.
// Callers sort by time first.
double accumulate_distance(const std::vector<GpsFix> &points,
                           const DistanceParams &params);

double speed_kmh(ActivityType activity, const SpeedTable &speeds);

// Rough fallback, rounded to two decimals.
double estimate_distance_from_duration(double duration_minutes,
                                       ActivityType activity,
                                       const SpeedTable &speeds);

TransportType transport_for(ActivityType activity);

// Confidence-weighted vote over moving samples. Ties go to the type seen
// most recently. Without moving samples, `fallback` is reported with
// `fallback_confidence`.
Classification classify_transport_type(const std::vector<ActivitySample> &samples,
                                       ActivityType fallback,
                                       int fallback_confidence);

GpsQualityReport score_gps_quality(const std::vector<GpsFix> &accepted,
                                   size_t rejected_count);

} // namespace estimator
} // namespace tripsense
