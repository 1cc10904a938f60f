#include "capture/observation.h"

namespace tripsense {

const char *activity_to_string(ActivityType type) {
  switch (type) {
  case ActivityType::STILL:
    return "STILL";
  case ActivityType::WALKING:
    return "WALKING";
  case ActivityType::RUNNING:
    return "RUNNING";
  case ActivityType::ON_BICYCLE:
    return "ON_BICYCLE";
  case ActivityType::IN_VEHICLE:
    return "IN_VEHICLE";
  case ActivityType::TILTING:
    return "TILTING";
  case ActivityType::UNKNOWN:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::optional<ActivityType> activity_from_string(const std::string &name) {
  if (name == "STILL")
    return ActivityType::STILL;
  if (name == "WALKING" || name == "ON_FOOT")
    return ActivityType::WALKING;
  if (name == "RUNNING")
    return ActivityType::RUNNING;
  if (name == "ON_BICYCLE")
    return ActivityType::ON_BICYCLE;
  if (name == "IN_VEHICLE")
    return ActivityType::IN_VEHICLE;
  if (name == "TILTING")
    return ActivityType::TILTING;
  if (name == "UNKNOWN")
    return ActivityType::UNKNOWN;
  return std::nullopt;
}

const char *transition_to_string(TransitionKind kind) {
  return kind == TransitionKind::ENTER ? "ENTER" : "EXIT";
}

std::optional<TransitionKind> transition_from_string(const std::string &name) {
  if (name == "ENTER")
    return TransitionKind::ENTER;
  if (name == "EXIT")
    return TransitionKind::EXIT;
  return std::nullopt;
}

} // namespace tripsense
