#pragma once

#include <stdexcept>
#include <string>

namespace tripsense {

struct PermissionStatus {
  bool location{false};
  bool activity_recognition{false};
  bool notifications{false};
  bool all_granted{false};
};

class TripsenseError : public std::runtime_error {
public:
  explicit TripsenseError(const std::string &what)
      : std::runtime_error(what) {}
};

// surfaced to the UI; detection may still attempt a degraded start
class PermissionDenied : public TripsenseError {
public:
  PermissionDenied(const std::string &what, const PermissionStatus &status)
      : TripsenseError(what), status_(status) {}

  const PermissionStatus &status() const { return status_; }

private:
  PermissionStatus status_;
};

// transient, retried on the next start()
class AdapterUnavailable : public TripsenseError {
public:
  explicit AdapterUnavailable(const std::string &what) : TripsenseError(what) {}
};

class PersistenceFailure : public TripsenseError {
public:
  explicit PersistenceFailure(const std::string &what)
      : TripsenseError(what) {}
};

class ConfigError : public TripsenseError {
public:
  explicit ConfigError(const std::string &what) : TripsenseError(what) {}
};

} // namespace tripsense
