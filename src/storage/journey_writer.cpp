#include "storage/journey_writer.h"
#include <algorithm>

namespace tripsense {

JourneyWriter::JourneyWriter(std::shared_ptr<JourneyStore> store,
                             std::chrono::milliseconds retry_initial,
                             std::chrono::milliseconds retry_max)
    : Service("journey_writer"), store_(std::move(store)),
      retry_initial_(std::max(retry_initial, std::chrono::milliseconds(1))),
      retry_max_(std::max(retry_max, retry_initial_)),
      logger_(Logger::get("writer")) {}

JourneyWriter::~JourneyWriter() {
  if (running_) {
    stop();
  }
}

bool JourneyWriter::init() {
  if (!store_) {
    LOG_ERROR(logger_, "journey writer has no store");
    return false;
  }
  LOG_INFO(logger_, "journey writer initialized, retry {}-{} ms",
           retry_initial_.count(), retry_max_.count());
  return true;
}

bool JourneyWriter::start() {
  if (running_)
    return true;

  running_ = true;
  writer_thread_ = std::thread(&JourneyWriter::writer_loop, this);
  LOG_INFO(logger_, "journey writer started");
  return true;
}

bool JourneyWriter::stop() {
  if (!running_)
    return true;

  LOG_INFO(logger_, "stopping journey writer");
  running_ = false;
  queue_cv_.notify_all();

  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }

  // final drain on the caller's thread, one attempt per journey
  size_t attempts = pending();
  for (size_t i = 0; i < attempts; ++i) {
    if (!write_front())
      break;
  }

  size_t held = pending();
  if (held > 0) {
    LOG_ERROR(logger_, "{} journey(s) could not be persisted and are held in "
                       "memory until the next start",
              held);
    return false;
  }
  return true;
}

bool JourneyWriter::shutdown() {
  bool ok = stop();
  auto s = get_stats();
  LOG_INFO(logger_,
           "journey writer shutdown - submitted: {}, written: {}, failures: {}",
           s.submitted, s.written, s.failures);
  return ok;
}

void JourneyWriter::submit(const LocalJourney &journey) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  queue_.push_back(journey);
  stats_.submitted++;
  queue_cv_.notify_one();
}

bool JourneyWriter::flush(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  return idle_cv_.wait_for(lock, timeout,
                           [this] { return queue_.empty() && !in_flight_; });
}

size_t JourneyWriter::pending() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

void JourneyWriter::set_callback(JourneyPersistedCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = cb;
}

JourneyWriter::Stats JourneyWriter::get_stats() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return stats_;
}

bool JourneyWriter::write_front() {
  LocalJourney journey;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_.empty())
      return true;
    journey = queue_.front();
    in_flight_ = true;
  }

  int64_t id = 0;
  try {
    id = store_->insert(journey);
  } catch (const std::exception &e) {
    // PersistenceFailure or anything else the store raises
    LOG_ERROR(logger_, "failed to persist journey ({} -> {}): {}",
              journey.time_departure, journey.time_arrival, e.what());
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stats_.failures++;
    in_flight_ = false;
    idle_cv_.notify_all();
    return false;
  }

  // the row is committed; from here on the journey must not be retried
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.pop_front();
    stats_.written++;
  }

  std::optional<LocalJourney> saved;
  try {
    saved = store_->get(id);
  } catch (const std::exception &e) {
    LOG_WARN(logger_, "journey {} stored but could not be read back: {}", id,
             e.what());
  }
  if (!saved) {
    saved = journey;
    saved->id = id;
  }

  JourneyPersistedCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = callback_;
  }
  if (cb) {
    try {
      cb(*saved);
    } catch (const std::exception &e) {
      LOG_ERROR(logger_, "journey callback threw: {}", e.what());
    }
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    in_flight_ = false;
  }
  idle_cv_.notify_all();
  return true;
}

void JourneyWriter::writer_loop() {
  auto backoff = retry_initial_;

  while (running_) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      if (!running_)
        break;
    }

    if (write_front()) {
      backoff = retry_initial_;
      continue;
    }

    LOG_WARN(logger_, "retrying in {} ms", backoff.count());
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, backoff, [this] { return !running_; });
    backoff = std::min(backoff * 2, retry_max_);
  }
}

} // namespace tripsense
