#pragma once

#include "services/service.h"
#include <functional>
#include <memory>
#include <mutex>

namespace tripsense {

template <typename Event> class Stream : public Service {
public:
  using Callback = std::function<void(const Event &)>;

  explicit Stream(const std::string &name) : Service(name) {}
  virtual ~Stream() = default;

  void set_callback(Callback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = cb;
  }

protected:
  void publish(const Event &event) {
    Callback cb;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb = callback_;
    }
    if (cb)
      cb(event);
  }

  std::mutex callback_mutex_;
  Callback callback_;
};

} // namespace tripsense
