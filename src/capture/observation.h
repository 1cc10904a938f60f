#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tripsense {

enum class ActivityType {
  STILL,
  WALKING,
  RUNNING,
  ON_BICYCLE,
  IN_VEHICLE,
  TILTING,
  UNKNOWN,
};

enum class TransitionKind { ENTER, EXIT };

inline bool is_moving(ActivityType type) {
  switch (type) {
  case ActivityType::WALKING:
  case ActivityType::RUNNING:
  case ActivityType::ON_BICYCLE:
  case ActivityType::IN_VEHICLE:
    return true;
  default:
    return false;
  }
}

const char *activity_to_string(ActivityType type);
std::optional<ActivityType> activity_from_string(const std::string &name);

const char *transition_to_string(TransitionKind kind);
std::optional<TransitionKind> transition_from_string(const std::string &name);

struct ActivityObservation {
  ActivityType activity_type{ActivityType::UNKNOWN};
  TransitionKind transition_kind{TransitionKind::ENTER};
  int64_t observed_at_nanos{0};
  int confidence{0}; // 0-100

  bool operator==(const ActivityObservation &other) const {
    return activity_type == other.activity_type &&
           transition_kind == other.transition_kind &&
           observed_at_nanos == other.observed_at_nanos;
  }
};

struct GpsFix {
  double latitude{0.0};
  double longitude{0.0};
  float horizontal_accuracy_meters{0.0f};
  int64_t observed_at_millis{0};
};

} // namespace tripsense
