#pragma once

#include "capture/host_sources.h"
#include "common/clock.h"
#include "common/logger.h"
#include "replay/trace_reader.h"
#include "services/service.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace tripsense {

// Plays a recorded trace as if it came from the host activity and location
// services. Event offsets are measured on `clock` from start(); pair it
// with a ScaledClock to replay faster than real time.
class ReplaySource : public ActivityRecognitionSource,
                     public LocationSource,
                     public Service {
public:
  ReplaySource(std::vector<TraceEvent> events, std::shared_ptr<Clock> clock);
  ~ReplaySource() override;

  bool init() override;
  bool start() override;
  bool stop() override;
  bool shutdown() override;
  bool running() const override { return running_; }

  bool register_transitions(TransitionHandler handler) override;
  void unregister_transitions() override;

  bool request_updates(std::chrono::milliseconds interval, FixHandler on_fix,
                       ErrorHandler on_error) override;
  void remove_updates() override;

  bool finished() const { return finished_; }
  bool wait_until_finished(std::chrono::milliseconds timeout);

  static int to_activity_code(ActivityType type);

  struct Stats {
    uint64_t activity_delivered{0};
    uint64_t fixes_delivered{0};
    uint64_t fixes_dropped{0}; // no location request active
    uint64_t errors_delivered{0};
  };
  Stats get_stats() const;

private:
  void playback_loop();
  void deliver(const TraceEvent &event);

  std::vector<TraceEvent> events_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  TransitionHandler transition_handler_;
  FixHandler fix_handler_;
  ErrorHandler error_handler_;

  std::atomic<bool> running_{false};
  std::atomic<bool> finished_{false};
  std::thread playback_thread_;

  int64_t base_elapsed_ns_{0};
  int64_t base_epoch_ms_{0};

  Stats stats_;
};

} // namespace tripsense
