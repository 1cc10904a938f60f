#pragma once

#include "capture/host_sources.h"
#include "capture/location_control.h"
#include "capture/observation.h"
#include "capture/stream.h"
#include "common/logger.h"
#include <atomic>
#include <chrono>
#include <memory>

namespace tripsense {

using LocationErrorCallback = std::function<void(const std::string &)>;

// Location adapter: requests fixes from the host only while a trip needs
// them and publishes well-formed fixes as GpsFix events. Accuracy
// filtering against the trip threshold happens downstream.
class LocationStream : public Stream<GpsFix>, public LocationControl {
public:
  LocationStream(std::shared_ptr<LocationSource> source,
                 std::chrono::milliseconds interval);
  ~LocationStream() override;

  bool init() override;
  bool start() override;
  bool stop() override;
  bool shutdown() override;
  bool running() const override { return tracking_; }

  bool start_tracking() override { return start(); }
  void stop_tracking() override;
  bool tracking() const override { return tracking_; }

  void set_error_callback(LocationErrorCallback cb);

  static bool is_well_formed(double latitude, double longitude,
                             float accuracy_m);

  struct Stats {
    uint64_t received{0};
    uint64_t published{0};
    uint64_t malformed{0};
    uint64_t errors{0};
  };
  Stats get_stats() const;

private:
  void on_fix(double latitude, double longitude, float accuracy_m,
              int64_t epoch_ms);
  void on_error(const std::string &message);

  std::shared_ptr<LocationSource> source_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<spdlog::logger> logger_;

  std::atomic<bool> tracking_{false};

  mutable std::mutex stats_mutex_;
  Stats stats_;

  std::mutex error_mutex_;
  LocationErrorCallback error_callback_;
};

} // namespace tripsense
