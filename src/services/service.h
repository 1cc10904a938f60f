#pragma once

#include <string>

namespace tripsense {

// Lifecycle shared by every long-lived component. init() runs once before
// the first start(); start() and stop() may alternate any number of times
// and are no-ops when already in the requested state. Failures are
// reported through the return value and logged by the service itself.
class Service {
public:
  explicit Service(const std::string &name) : name_(name) {}
  virtual ~Service() = default;

  virtual bool init() = 0;
  virtual bool start() = 0;
  virtual bool stop() = 0;
  virtual bool shutdown() = 0;
  virtual bool running() const = 0;

  const std::string &name() const { return name_; }

protected:
  std::string name_;
};
} // namespace tripsense
