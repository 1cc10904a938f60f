#pragma once

#include "capture/host_sources.h"
#include "capture/observation.h"
#include "capture/stream.h"
#include "common/logger.h"
#include <atomic>
#include <memory>
#include <optional>

namespace tripsense {

// Activity classifier adapter: turns raw host transition callbacks into
// ActivityObservation events.
class ActivityStream : public Stream<ActivityObservation> {
public:
  ActivityStream(std::shared_ptr<ActivityRecognitionSource> source,
                 int default_confidence);
  ~ActivityStream() override;

  bool init() override;
  bool start() override;
  bool stop() override;
  bool shutdown() override;

  bool running() const override { return running_; }

  static ActivityType map_activity_code(int code);

  struct Stats {
    uint64_t received{0};
    uint64_t published{0};
    uint64_t duplicates{0};
    uint64_t malformed{0};
  };
  Stats get_stats() const;

private:
  void on_transition(int activity_code, int transition_code,
                     int64_t elapsed_realtime_ns, int confidence);

  std::shared_ptr<ActivityRecognitionSource> source_;
  int default_confidence_;
  std::shared_ptr<spdlog::logger> logger_;

  std::atomic<bool> running_{false};

  mutable std::mutex state_mutex_;
  std::optional<ActivityObservation> last_;
  Stats stats_;
};

} // namespace tripsense
