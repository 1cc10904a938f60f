#include "common/clock.h"
#include "common/config.h"
#include "common/errors.h"
#include "common/logger.h"
#include "detection/detection_controller.h"
#include "network/journey_payload.h"
#include "replay/replay_source.h"
#include "replay/trace_reader.h"
#include "storage/sqlite_journey_store.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> running{true};

void signal_handler(int) { running = false; }

const char *kUsage =
    "Usage: tripsense [config.yaml] [--replay <trace.csv>] [--speed <x>]\n"
    "                 [--list] [--show <id>] [--mark-sent <id>]\n"
    "                 [--delete <id>] [--export <id>] [--simulate] [--debug]\n";

enum class Command { DETECT, LIST, SHOW, MARK_SENT, DELETE, EXPORT, SIMULATE };

bool parse_id(const std::string &s, int64_t &id) {
  try {
    size_t pos = 0;
    id = std::stoll(s, &pos);
    return pos == s.size() && id > 0;
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

int main(int argc, char **argv) {
  using namespace tripsense;

  std::string config_path = "config/default.yaml";
  std::string replay_path;
  double speed = 1.0;
  bool debug = false;
  Command command = Command::DETECT;
  int64_t journey_id = 0;

  // parse args
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto next_id = [&](Command c) {
      if (i + 1 >= argc || !parse_id(argv[++i], journey_id)) {
        std::cerr << arg << " needs a journey id\n" << kUsage;
        std::exit(2);
      }
      command = c;
    };

    if (arg == "--replay" && i + 1 < argc) {
      replay_path = argv[++i];
    } else if (arg == "--speed" && i + 1 < argc) {
      try {
        speed = std::stod(argv[++i]);
      } catch (const std::exception &) {
        speed = 0.0;
      }
      if (speed <= 0.0) {
        std::cerr << "--speed must be a positive number\n";
        return 2;
      }
    } else if (arg == "--list") {
      command = Command::LIST;
    } else if (arg == "--show") {
      next_id(Command::SHOW);
    } else if (arg == "--mark-sent") {
      next_id(Command::MARK_SENT);
    } else if (arg == "--delete") {
      next_id(Command::DELETE);
    } else if (arg == "--export") {
      next_id(Command::EXPORT);
    } else if (arg == "--simulate") {
      command = Command::SIMULATE;
    } else if (arg == "--debug") {
      debug = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << kUsage;
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "unknown option: " << arg << "\n" << kUsage;
      return 2;
    } else {
      config_path = arg;
    }
  }

  if (!std::filesystem::exists(config_path)) {
    config_path = "../config/default.yaml";
  }

  try {
    Config::instance().load(config_path);
  } catch (const std::exception &e) {
    std::cerr << "Config error: " << e.what() << std::endl;
    return 1;
  }

  Logger::init(Config::instance().log_level(), Config::instance().log_dir());

  auto logger = Logger::get("main");
  LOG_INFO(logger, "{} starting", Config::instance().system_name());
  LOG_INFO(logger, "config loaded from: {}", config_path);

  DetectionConfig detection = Config::instance().detection();

  std::shared_ptr<Clock> clock;
  if (!replay_path.empty() && speed != 1.0) {
    clock = std::make_shared<ScaledClock>(speed);
  } else {
    clock = std::make_shared<SystemClock>();
  }

  std::shared_ptr<JourneyStore> store;
  try {
    std::string db_path = Config::instance().data_dir() + "/journeys.db";
    store = std::make_shared<SqliteJourneyStore>(db_path, clock);
    LOG_INFO(logger, "journey store: {}", db_path);
  } catch (const PersistenceFailure &e) {
    LOG_ERROR(logger, "cannot open journey store: {}", e.what());
    return 1;
  }

  try {
    switch (command) {
    case Command::LIST: {
      for (const auto &j : store->list_all()) {
        std::cout << journey_to_json(j) << "\n";
      }
      std::cout << store->count_pending() << " pending\n";
      return 0;
    }
    case Command::SHOW: {
      auto j = store->get(journey_id);
      if (!j) {
        std::cerr << "journey " << journey_id << " not found\n";
        return 1;
      }
      std::cout << journey_to_json(*j) << "\n";
      return 0;
    }
    case Command::EXPORT: {
      auto j = store->get(journey_id);
      if (!j) {
        std::cerr << "journey " << journey_id << " not found\n";
        return 1;
      }
      std::cout << make_submission(*j, DetectionSource::AUTO).to_json() << "\n";
      return 0;
    }
    case Command::MARK_SENT:
      if (!store->mark_sent(journey_id)) {
        std::cerr << "journey " << journey_id << " not found\n";
        return 1;
      }
      std::cout << "journey " << journey_id << " marked sent\n";
      return 0;
    case Command::DELETE:
      if (!store->remove(journey_id)) {
        std::cerr << "journey " << journey_id << " not found\n";
        return 1;
      }
      std::cout << "journey " << journey_id << " deleted\n";
      return 0;
    case Command::SIMULATE:
    case Command::DETECT:
      break;
    }
  } catch (const PersistenceFailure &e) {
    LOG_ERROR(logger, "journey store error: {}", e.what());
    return 1;
  }

  std::shared_ptr<ReplaySource> replay;
  if (!replay_path.empty()) {
    TraceReader reader(replay_path);
    if (!reader.open()) {
      LOG_ERROR(logger, "failed to read trace: {}", replay_path);
      return 1;
    }
    LOG_INFO(logger, "REPLAY MODE: {} at {}x", replay_path, speed);
    replay = std::make_shared<ReplaySource>(reader.events(), clock);
  }

  DetectionController controller(detection, store, replay, replay, nullptr,
                                 clock);
  if (debug) {
    controller.set_debug_mode(true);
  }

  controller.on_trip_detected([](const LocalJourney &journey) {
    std::cout << journey_to_json(journey) << std::endl;
  });
  controller.on_state_changed([logger](const DetectionStateEvent &e) {
    LOG_DEBUG(logger, "state: running={} trip={} debug={}", e.running,
              trip_state_to_string(e.trip_state), e.debug_mode);
  });
  controller.on_gps_log([logger](const GpsLogEvent &e) {
    LOG_DEBUG(logger, "gps log: {} {}", GpsLogEvent::type_to_string(e.type),
              e.detail);
  });

  if (command == Command::SIMULATE) {
    try {
      controller.simulate_trip();
    } catch (const PersistenceFailure &e) {
      LOG_ERROR(logger, "simulation failed: {}", e.what());
      return 1;
    }
    return 0;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  try {
    StartMode mode = controller.start();
    LOG_INFO(logger, "detection running ({})", start_mode_to_string(mode));
  } catch (const PermissionDenied &e) {
    LOG_ERROR(logger, "permission denied: {}", e.what());
    return 1;
  } catch (const AdapterUnavailable &e) {
    LOG_ERROR(logger, "no activity recognition source: {} (use --replay)",
              e.what());
    return 1;
  }

  if (replay && (!replay->init() || !replay->start())) {
    LOG_ERROR(logger, "replay failed to start");
    controller.stop();
    return 1;
  }

  // after the trace ends, give the last stop window time to elapse
  int64_t settle_ms = static_cast<int64_t>(
      (detection.stop_debounce_s + detection.moving_debounce_s + 1.0) * 1000);
  int64_t finished_at_ms = -1;

  while (running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    if (replay && replay->finished()) {
      if (finished_at_ms < 0) {
        finished_at_ms = clock->now_ms();
        LOG_INFO(logger, "trace finished, waiting for pending confirmations");
      } else if (clock->now_ms() - finished_at_ms >= settle_ms) {
        break;
      }
    }
  }

  LOG_INFO(logger, "shutting down...");
  if (replay) {
    replay->stop();
  }
  controller.stop();
  LOG_INFO(logger, "{} pending journey(s)", controller.get_pending_count());

  LOG_INFO(logger, "tripsense stopped");
  return 0;
}
