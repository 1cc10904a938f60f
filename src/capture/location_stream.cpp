#include "capture/location_stream.h"
#include <cmath>

namespace tripsense {

LocationStream::LocationStream(std::shared_ptr<LocationSource> source,
                               std::chrono::milliseconds interval)
    : Stream("location_stream"), source_(std::move(source)),
      interval_(interval), logger_(Logger::get("location")) {}

LocationStream::~LocationStream() {
  if (tracking_) {
    stop();
  }
}

bool LocationStream::init() {
  if (!source_) {
    LOG_WARN(logger_, "no location source, trips will use estimated distance");
    return true;
  }
  LOG_INFO(logger_, "location stream initialized, interval {} ms",
           interval_.count());
  return true;
}

bool LocationStream::start() {
  if (tracking_)
    return true;
  if (!source_) {
    LOG_WARN(logger_, "cannot start tracking: no location source");
    return false;
  }

  tracking_ = true;
  bool requested = false;
  try {
    requested = source_->request_updates(
        interval_,
        [this](double lat, double lon, float acc, int64_t ts) {
          on_fix(lat, lon, acc, ts);
        },
        [this](const std::string &msg) { on_error(msg); });
  } catch (const std::exception &e) {
    LOG_ERROR(logger_, "location request threw: {}", e.what());
    requested = false;
  }

  if (!requested) {
    tracking_ = false;
    LOG_ERROR(logger_, "location updates could not be requested");
    return false;
  }

  LOG_INFO(logger_, "GPS tracking started");
  return true;
}

bool LocationStream::stop() {
  if (!tracking_)
    return true;

  tracking_ = false;
  try {
    source_->remove_updates();
  } catch (const std::exception &e) {
    LOG_WARN(logger_, "removing location updates threw: {}", e.what());
    return false;
  }
  LOG_INFO(logger_, "GPS tracking stopped");
  return true;
}

void LocationStream::stop_tracking() {
  if (!stop())
    LOG_WARN(logger_, "GPS tracking did not stop cleanly");
}

bool LocationStream::shutdown() {
  bool ok = stop();
  auto s = get_stats();
  LOG_INFO(logger_,
           "location stream shutdown - received: {}, published: {}, "
           "malformed: {}, errors: {}",
           s.received, s.published, s.malformed, s.errors);
  return ok;
}

void LocationStream::set_error_callback(LocationErrorCallback cb) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  error_callback_ = cb;
}

bool LocationStream::is_well_formed(double latitude, double longitude,
                                    float accuracy_m) {
  if (!std::isfinite(latitude) || !std::isfinite(longitude))
    return false;
  if (latitude < -90.0 || latitude > 90.0)
    return false;
  if (longitude < -180.0 || longitude > 180.0)
    return false;
  return std::isfinite(accuracy_m) && accuracy_m >= 0.0f;
}

LocationStream::Stats LocationStream::get_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void LocationStream::on_fix(double latitude, double longitude,
                            float accuracy_m, int64_t epoch_ms) {
  if (!tracking_)
    return;

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.received++;
    if (!is_well_formed(latitude, longitude, accuracy_m)) {
      stats_.malformed++;
      LOG_WARN(logger_, "malformed fix dropped: ({}, {}) accuracy {}",
               latitude, longitude, accuracy_m);
      return;
    }
    stats_.published++;
  }

  LOG_TRACE(logger_, "fix ({:.6f}, {:.6f}) accuracy {:.1f} m", latitude,
            longitude, accuracy_m);
  publish(GpsFix{latitude, longitude, accuracy_m, epoch_ms});
}

void LocationStream::on_error(const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.errors++;
  }
  LOG_WARN(logger_, "location error: {}", message);

  LocationErrorCallback cb;
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    cb = error_callback_;
  }
  if (cb)
    cb(message);
}

} // namespace tripsense
