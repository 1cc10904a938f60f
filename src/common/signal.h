#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tripsense {

using SubscriptionId = uint64_t;

// Ids are unique across every Signal in the process, so one id is enough
// to unsubscribe without knowing which signal it came from.
inline SubscriptionId next_subscription_id() {
  static std::atomic<SubscriptionId> counter{0};
  return ++counter;
}

// Thread-safe subscriber list. Handlers are invoked outside the lock so a
// handler may subscribe or unsubscribe without deadlocking. A throwing
// handler does not stop delivery to the others.
template <typename... Args> class Signal {
public:
  using Handler = std::function<void(Args...)>;

  SubscriptionId subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_subscription_id();
    handlers_.emplace_back(id, std::move(handler));
    return id;
  }

  bool unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
      if (it->first == id) {
        handlers_.erase(it);
        return true;
      }
    }
    return false;
  }

  // returns the number of handlers that threw
  size_t emit(Args... args) const {
    std::vector<std::pair<SubscriptionId, Handler>> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot = handlers_;
    }
    size_t failed = 0;
    for (auto &entry : snapshot) {
      if (!entry.second)
        continue;
      try {
        entry.second(args...);
      } catch (const std::exception &) {
        failed++;
      }
    }
    return failed;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<SubscriptionId, Handler>> handlers_;
};

} // namespace tripsense
