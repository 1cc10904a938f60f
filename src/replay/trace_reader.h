#pragma once

#include "capture/observation.h"
#include "common/logger.h"
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace tripsense {

enum class TraceEventKind { ACTIVITY, GPS, LOCATION_ERROR };

struct TraceEvent {
  TraceEventKind kind{TraceEventKind::ACTIVITY};
  int64_t offset_ms{0};

  ActivityType activity{ActivityType::UNKNOWN};
  TransitionKind transition{TransitionKind::ENTER};
  int confidence{-1}; // not supplied

  double latitude{0.0};
  double longitude{0.0};
  float accuracy_m{0.0f};

  std::string message;
};

// Reads a recorded sensor trace:
//   activity,<offset_ms>,<ACTIVITY>,<ENTER|EXIT>[,<confidence>]
//   gps,<offset_ms>,<lat>,<lon>,<accuracy_m>
//   location_error,<offset_ms>,<message>
// Blank lines and lines starting with '#' are skipped.
class TraceReader {
public:
  explicit TraceReader(const std::string &path);

  bool open();
  bool read(std::istream &in);

  // ordered by offset; events with equal offsets keep file order
  const std::vector<TraceEvent> &events() const { return events_; }
  size_t malformed_lines() const { return malformed_; }
  int64_t duration_ms() const;

  static std::optional<TraceEvent> parse_line(const std::string &line);

private:
  std::string path_;
  std::shared_ptr<spdlog::logger> logger_;

  std::vector<TraceEvent> events_;
  size_t malformed_{0};
};

} // namespace tripsense
