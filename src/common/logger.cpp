#include "common/logger.h"
#include <filesystem>
#include <memory>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <vector>

namespace tripsense {

namespace {
const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%^%l%$] [%n] %v";
} // namespace

bool Logger::initialized_ = false;
std::mutex Logger::mutex_;
std::string Logger::level_ = "info";
spdlog::sink_ptr Logger::file_sink_;

spdlog::level::level_enum Logger::parse_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  return spdlog::level::info;
}

void Logger::init(const std::string &level, const std::string &log_dir) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_)
    return;

  std::filesystem::create_directories(log_dir);
  file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      log_dir + "/tripsense.log");

  spdlog::set_pattern(kPattern);
  level_ = level;
  spdlog::set_level(parse_level(level));

  initialized_ = true;
}

void Logger::set_level(const std::string &level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
  spdlog::set_level(parse_level(level));
}

std::string Logger::level() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto logger = spdlog::get(name);
  if (!logger) {
    auto console_sink =
        std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (file_sink_)
      sinks.push_back(file_sink_);
    logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(parse_level(level_));
    spdlog::register_logger(logger);
  }

  return logger;
}

} // namespace tripsense
