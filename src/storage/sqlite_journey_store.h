#pragma once

#include "common/clock.h"
#include "common/logger.h"
#include "storage/journey_store.h"
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>

namespace tripsense {

class SqliteJourneyStore final : public JourneyStore {
public:
  // path may be ":memory:" for a throwaway store
  SqliteJourneyStore(const std::string &path, std::shared_ptr<Clock> clock);
  ~SqliteJourneyStore() override;

  SqliteJourneyStore(const SqliteJourneyStore &) = delete;
  SqliteJourneyStore &operator=(const SqliteJourneyStore &) = delete;

  int64_t insert(const LocalJourney &journey) override;
  std::optional<LocalJourney> get(int64_t id) override;
  std::vector<LocalJourney> list_pending() override;
  std::vector<LocalJourney> list_by_status(JourneyStatus status) override;
  std::vector<LocalJourney> list_all() override;
  int count_pending() override;

  bool update(int64_t id, const JourneyUpdate &fields) override;
  bool mark_sent(int64_t id) override;
  bool remove(int64_t id) override;

  const std::string &path() const { return path_; }

private:
  void exec(const char *sql);
  void create_schema();
  std::vector<LocalJourney> query_journeys(const std::string &where,
                                           const std::string &status);

  std::string path_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<spdlog::logger> logger_;

  std::mutex mutex_;
  sqlite3 *db_ = nullptr;
};

} // namespace tripsense
