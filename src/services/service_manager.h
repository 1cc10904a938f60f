#pragma once

#include "common/logger.h"
#include "services/service.h"
#include <memory>
#include <vector>

namespace tripsense {

// Starts services in registration order and stops them in reverse.
// A failed start rolls back the services that were already started.
class ServiceManager {
public:
  void add(std::shared_ptr<Service> service) { services_.push_back(service); }

  bool init_all() {
    auto logger = Logger::get("service_manager");
    for (auto &svc : services_) {
      LOG_INFO(logger, "initializing service: {}", svc->name());
      if (!svc->init()) {
        LOG_ERROR(logger, "failed to init service: {}", svc->name());
        return false;
      }
    }
    return true;
  }

  bool start_all() {
    auto logger = Logger::get("service_manager");
    for (size_t i = 0; i < services_.size(); ++i) {
      auto &svc = services_[i];
      LOG_INFO(logger, "starting service: {}", svc->name());
      if (!svc->start()) {
        LOG_ERROR(logger, "failed to start service: {}", svc->name());
        for (size_t j = i; j > 0; --j) {
          if (!services_[j - 1]->running())
            continue;
          LOG_INFO(logger, "rolling back service: {}",
                   services_[j - 1]->name());
          if (!services_[j - 1]->stop())
            LOG_WARN(logger, "rollback of {} failed", services_[j - 1]->name());
        }
        return false;
      }
    }
    return true;
  }

  void stop_all() {
    auto logger = Logger::get("service_manager");
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
      if (!(*it)->running())
        continue;
      LOG_INFO(logger, "stopping service: {}", (*it)->name());
      if (!(*it)->stop())
        LOG_WARN(logger, "service {} did not stop cleanly", (*it)->name());
    }
  }

  void shutdown_all() {
    auto logger = Logger::get("service_manager");
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
      LOG_INFO(logger, "shutting down service: {}", (*it)->name());
      if (!(*it)->shutdown())
        LOG_WARN(logger, "service {} did not shut down cleanly", (*it)->name());
    }
  }

  size_t size() const { return services_.size(); }

  size_t running_count() const {
    size_t n = 0;
    for (const auto &svc : services_) {
      if (svc->running())
        n++;
    }
    return n;
  }

private:
  std::vector<std::shared_ptr<Service>> services_;
};

} // namespace tripsense
