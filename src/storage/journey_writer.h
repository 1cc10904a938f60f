#pragma once

#include "common/logger.h"
#include "services/service.h"
#include "storage/journey_store.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace tripsense {

using JourneyPersistedCallback = std::function<void(const LocalJourney &)>;

// Persists completed journeys off the detection loop. A journey is only
// reported through the callback once it is in the store; on failure it
// stays queued in memory and is retried with exponential backoff.
class JourneyWriter : public Service {
public:
  JourneyWriter(std::shared_ptr<JourneyStore> store,
                std::chrono::milliseconds retry_initial,
                std::chrono::milliseconds retry_max);
  ~JourneyWriter() override;

  bool init() override;
  bool start() override;
  bool stop() override;
  bool shutdown() override;
  bool running() const override { return running_; }

  void submit(const LocalJourney &journey);

  // Waits until nothing is queued or in flight.
  bool flush(std::chrono::milliseconds timeout);

  size_t pending() const;

  void set_callback(JourneyPersistedCallback cb);

  struct Stats {
    uint64_t submitted{0};
    uint64_t written{0};
    uint64_t failures{0};
  };
  Stats get_stats() const;

private:
  void writer_loop();
  // true when the front journey was written
  bool write_front();

  std::shared_ptr<JourneyStore> store_;
  std::chrono::milliseconds retry_initial_;
  std::chrono::milliseconds retry_max_;
  std::shared_ptr<spdlog::logger> logger_;

  std::deque<LocalJourney> queue_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  bool in_flight_{false};

  std::atomic<bool> running_{false};
  std::thread writer_thread_;

  std::mutex callback_mutex_;
  JourneyPersistedCallback callback_;

  Stats stats_;
};

} // namespace tripsense
