#include "estimation/trip_estimator.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>

namespace tripsense {

const char *gps_quality_to_string(GpsQuality quality) {
  switch (quality) {
  case GpsQuality::EXCELLENT:
    return "excellent";
  case GpsQuality::GOOD:
    return "good";
  case GpsQuality::DEGRADED:
    return "degraded";
  case GpsQuality::LOST:
    return "lost";
  }
  return "unknown";
}

namespace estimator {

namespace {
double deg2rad(double deg) { return deg * M_PI / 180.0; }
} // namespace

double haversine_km(const GpsFix &a, const GpsFix &b) {
  double phi1 = deg2rad(a.latitude);
  double phi2 = deg2rad(b.latitude);
  double delta_phi = deg2rad(b.latitude - a.latitude);
  double delta_lambda = deg2rad(b.longitude - a.longitude);

  double h = std::pow(std::sin(delta_phi / 2), 2) +
             std::cos(phi1) * std::cos(phi2) *
                 std::pow(std::sin(delta_lambda / 2), 2);
  return 2 * kEarthRadiusKm * std::asin(std::sqrt(std::min(h, 1.0)));
}

bool is_fix_accepted(const GpsFix &fix, double accuracy_threshold_m) {
  return std::isfinite(fix.horizontal_accuracy_meters) &&
         fix.horizontal_accuracy_meters >= 0.0f &&
         fix.horizontal_accuracy_meters <= accuracy_threshold_m;
}

void sort_by_time(std::vector<GpsFix> &points) {
  std::stable_sort(points.begin(), points.end(),
                   [](const GpsFix &a, const GpsFix &b) {
                     return a.observed_at_millis < b.observed_at_millis;
                   });
}

double accumulate_distance(const std::vector<GpsFix> &points,
                           const DistanceParams &params) {
  double total_km = 0.0;
  const GpsFix *prev = nullptr;
  const int64_t max_gap_ms = static_cast<int64_t>(params.max_gap_s * 1000.0);

  for (const auto &fix : points) {
    if (!is_fix_accepted(fix, params.accuracy_threshold_m))
      continue;

    if (prev) {
      int64_t gap_ms = std::llabs(fix.observed_at_millis - prev->observed_at_millis);
      if (gap_ms <= max_gap_ms)
        total_km += haversine_km(*prev, fix);
    }
    prev = &fix;
  }

  return total_km;
}

double speed_kmh(ActivityType activity, const SpeedTable &speeds) {
  switch (activity) {
  case ActivityType::WALKING:
    return speeds.walking_kmh;
  case ActivityType::RUNNING:
    return speeds.running_kmh;
  case ActivityType::ON_BICYCLE:
    return speeds.cycling_kmh;
  case ActivityType::IN_VEHICLE:
    return speeds.vehicle_kmh;
  default:
    return 0.0;
  }
}

double estimate_distance_from_duration(double duration_minutes,
                                       ActivityType activity,
                                       const SpeedTable &speeds) {
  if (duration_minutes <= 0.0)
    return 0.0;
  double km = duration_minutes / 60.0 * speed_kmh(activity, speeds);
  return std::round(km * 100.0) / 100.0;
}

TransportType transport_for(ActivityType activity) {
  switch (activity) {
  case ActivityType::ON_BICYCLE:
    return TransportType::VELO;
  case ActivityType::IN_VEHICLE:
    return TransportType::VOITURE;
  default:
    return TransportType::MARCHE;
  }
}

Classification classify_transport_type(const std::vector<ActivitySample> &samples,
                                       ActivityType fallback,
                                       int fallback_confidence) {
  struct Tally {
    double weight{0.0};
    size_t last_seen{0};
    long confidence_sum{0};
    size_t count{0};
  };

  std::map<ActivityType, Tally> by_activity;
  std::map<TransportType, Tally> by_transport;

  for (size_t i = 0; i < samples.size(); ++i) {
    const auto &s = samples[i];
    if (!is_moving(s.activity_type))
      continue;

    int confidence = std::clamp(s.confidence, 0, 100);
    // a zero-confidence sample still counts as one vote
    double weight = std::max(confidence, 1);

    auto &a = by_activity[s.activity_type];
    a.weight += weight;
    a.last_seen = i + 1;
    a.confidence_sum += confidence;
    a.count++;

    auto &t = by_transport[transport_for(s.activity_type)];
    t.weight += weight;
    t.last_seen = i + 1;
    t.confidence_sum += confidence;
    t.count++;
  }

  Classification result;
  if (by_transport.empty()) {
    result.dominant_activity = fallback;
    result.transport_type = transport_for(fallback);
    result.confidence_avg = std::clamp(fallback_confidence, 0, 100);
    return result;
  }

  auto better = [](const Tally &a, const Tally &b) {
    if (a.weight != b.weight)
      return a.weight > b.weight;
    return a.last_seen > b.last_seen;
  };

  auto winner = by_transport.begin();
  for (auto it = by_transport.begin(); it != by_transport.end(); ++it) {
    if (better(it->second, winner->second))
      winner = it;
  }

  const Tally *dominant = nullptr;
  for (const auto &entry : by_activity) {
    if (transport_for(entry.first) != winner->first)
      continue;
    if (!dominant || better(entry.second, *dominant)) {
      dominant = &entry.second;
      result.dominant_activity = entry.first;
    }
  }

  result.transport_type = winner->first;
  result.confidence_avg = static_cast<int>(std::lround(
      static_cast<double>(winner->second.confidence_sum) /
      static_cast<double>(winner->second.count)));
  return result;
}

GpsQualityReport score_gps_quality(const std::vector<GpsFix> &accepted,
                                   size_t rejected_count) {
  GpsQualityReport report;
  report.accepted = accepted.size();
  report.rejected = rejected_count;

  size_t total = report.accepted + report.rejected;
  if (report.accepted == 0 || total == 0) {
    report.quality = GpsQuality::LOST;
    return report;
  }

  double accuracy_sum = 0.0;
  for (const auto &fix : accepted)
    accuracy_sum += fix.horizontal_accuracy_meters;

  report.acceptance_ratio =
      static_cast<double>(report.accepted) / static_cast<double>(total);
  report.mean_accuracy_m = accuracy_sum / static_cast<double>(report.accepted);

  if (report.acceptance_ratio >= 0.8 && report.mean_accuracy_m <= 20.0)
    report.quality = GpsQuality::EXCELLENT;
  else if (report.acceptance_ratio >= 0.5)
    report.quality = GpsQuality::GOOD;
  else
    report.quality = GpsQuality::DEGRADED;

  return report;
}

} // namespace estimator
} // namespace tripsense
