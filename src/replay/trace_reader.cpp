#include "replay/trace_reader.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace tripsense {

namespace {

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string &line, size_t max_fields) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (fields.size() + 1 < max_fields) {
    size_t comma = line.find(',', start);
    if (comma == std::string::npos)
      break;
    fields.push_back(trim(line.substr(start, comma - start)));
    start = comma + 1;
  }
  fields.push_back(trim(line.substr(start)));
  return fields;
}

template <typename T> std::optional<T> parse_number(const std::string &s) {
  std::istringstream iss(s);
  T value;
  iss >> value;
  if (iss.fail() || !iss.eof())
    return std::nullopt;
  return value;
}

} // namespace

TraceReader::TraceReader(const std::string &path)
    : path_(path), logger_(Logger::get("replay")) {}

bool TraceReader::open() {
  if (!std::filesystem::exists(path_)) {
    LOG_ERROR(logger_, "trace not found: {}", path_);
    return false;
  }

  std::ifstream in(path_);
  if (!in) {
    LOG_ERROR(logger_, "failed to open trace: {}", path_);
    return false;
  }

  if (!read(in))
    return false;

  LOG_INFO(logger_, "trace loaded: {} ({} events, {} malformed, {} ms)", path_,
           events_.size(), malformed_, duration_ms());
  return true;
}

bool TraceReader::read(std::istream &in) {
  events_.clear();
  malformed_ = 0;

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    line_no++;
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue;

    auto event = parse_line(trimmed);
    if (!event) {
      malformed_++;
      LOG_WARN(logger_, "skipping malformed trace line {}: {}", line_no,
               trimmed);
      continue;
    }
    events_.push_back(*event);
  }

  if (in.bad()) {
    LOG_ERROR(logger_, "error reading trace");
    return false;
  }

  std::stable_sort(events_.begin(), events_.end(),
                   [](const TraceEvent &a, const TraceEvent &b) {
                     return a.offset_ms < b.offset_ms;
                   });
  return true;
}

int64_t TraceReader::duration_ms() const {
  return events_.empty() ? 0 : events_.back().offset_ms;
}

std::optional<TraceEvent> TraceReader::parse_line(const std::string &line) {
  auto kind_end = line.find(',');
  if (kind_end == std::string::npos)
    return std::nullopt;
  std::string kind = trim(line.substr(0, kind_end));

  TraceEvent event;
  if (kind == "activity") {
    auto f = split(line, 5);
    if (f.size() < 4)
      return std::nullopt;
    auto offset = parse_number<int64_t>(f[1]);
    auto activity = activity_from_string(f[2]);
    auto transition = transition_from_string(f[3]);
    if (!offset || !activity || !transition)
      return std::nullopt;
    event.kind = TraceEventKind::ACTIVITY;
    event.offset_ms = *offset;
    event.activity = *activity;
    event.transition = *transition;
    if (f.size() == 5) {
      auto confidence = parse_number<int>(f[4]);
      if (!confidence)
        return std::nullopt;
      event.confidence = *confidence;
    }
  } else if (kind == "gps") {
    auto f = split(line, 5);
    if (f.size() != 5)
      return std::nullopt;
    auto offset = parse_number<int64_t>(f[1]);
    auto lat = parse_number<double>(f[2]);
    auto lon = parse_number<double>(f[3]);
    auto acc = parse_number<float>(f[4]);
    if (!offset || !lat || !lon || !acc)
      return std::nullopt;
    event.kind = TraceEventKind::GPS;
    event.offset_ms = *offset;
    event.latitude = *lat;
    event.longitude = *lon;
    event.accuracy_m = *acc;
  } else if (kind == "location_error") {
    // the message may itself contain commas
    auto f = split(line, 3);
    if (f.size() != 3)
      return std::nullopt;
    auto offset = parse_number<int64_t>(f[1]);
    if (!offset)
      return std::nullopt;
    event.kind = TraceEventKind::LOCATION_ERROR;
    event.offset_ms = *offset;
    event.message = f[2];
  } else {
    return std::nullopt;
  }

  if (event.offset_ms < 0)
    return std::nullopt;
  return event;
}

} // namespace tripsense
