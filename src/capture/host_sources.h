#pragma once

#include "common/errors.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace tripsense {

// Platform activity codes as delivered by the host recognition service.
namespace activity_code {
constexpr int IN_VEHICLE = 0;
constexpr int ON_BICYCLE = 1;
constexpr int ON_FOOT = 2;
constexpr int STILL = 3;
constexpr int UNKNOWN = 4;
constexpr int TILTING = 5;
constexpr int WALKING = 7;
constexpr int RUNNING = 8;
} // namespace activity_code

namespace transition_code {
constexpr int ENTER = 0;
constexpr int EXIT = 1;
} // namespace transition_code

// Host activity recognition. Callbacks may arrive on any thread, late, or
// not at all.
class ActivityRecognitionSource {
public:
  // confidence < 0 when the host does not report one
  using TransitionHandler =
      std::function<void(int activity_code, int transition_code,
                         int64_t elapsed_realtime_ns, int confidence)>;

  virtual ~ActivityRecognitionSource() = default;

  virtual bool register_transitions(TransitionHandler handler) = 0;
  virtual void unregister_transitions() = 0;
};

// Host fused location provider. May silently stop delivering fixes.
class LocationSource {
public:
  using FixHandler = std::function<void(double latitude, double longitude,
                                        float accuracy_m, int64_t epoch_ms)>;
  using ErrorHandler = std::function<void(const std::string &message)>;

  virtual ~LocationSource() = default;

  virtual bool request_updates(std::chrono::milliseconds interval,
                               FixHandler on_fix, ErrorHandler on_error) = 0;
  virtual void remove_updates() = 0;
};

class PermissionProvider {
public:
  virtual ~PermissionProvider() = default;

  virtual PermissionStatus check() = 0;
  virtual PermissionStatus request() = 0;
};

} // namespace tripsense
