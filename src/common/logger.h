#pragma once

#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

// MACROS
#define LOG_TRACE(logger, ...) logger->trace(__VA_ARGS__)
#define LOG_DEBUG(logger, ...) logger->debug(__VA_ARGS__)
#define LOG_INFO(logger, ...) logger->info(__VA_ARGS__)
#define LOG_WARN(logger, ...) logger->warn(__VA_ARGS__)
#define LOG_ERROR(logger, ...) logger->error(__VA_ARGS__)

namespace tripsense {
class Logger {
public:
  static void init(const std::string &level, const std::string &log_dir);
  static std::shared_ptr<spdlog::logger> get(const std::string &name);

  // applies to every registered logger and to loggers created later
  static void set_level(const std::string &level);
  static std::string level();

private:
  static spdlog::level::level_enum parse_level(const std::string &level);

  static bool initialized_;
  static std::mutex mutex_;
  static std::string level_;
  static spdlog::sink_ptr file_sink_;
};
} // namespace tripsense
