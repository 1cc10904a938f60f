// SqliteJourneyStore keeps detected journeys in a local SQLite database.

#include "storage/sqlite_journey_store.h"
#include "common/errors.h"
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace tripsense {

namespace {

const char *kColumns =
    "id, time_departure, time_arrival, duration_minutes, distance_km, "
    "detected_transport_type, confidence_avg, place_departure, place_arrival, "
    "start_latitude, start_longitude, end_latitude, end_longitude, "
    "is_gps_based_distance, gps_points_count, status, created_at, updated_at";

// Owns a prepared statement for the duration of one call.
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
      throw PersistenceFailure(std::string("prepare failed: ") +
                               sqlite3_errmsg(db));
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  void bind(int idx, int64_t value) {
    check(sqlite3_bind_int64(stmt_, idx, value));
  }
  void bind(int idx, int value) { check(sqlite3_bind_int(stmt_, idx, value)); }
  void bind(int idx, double value) {
    check(sqlite3_bind_double(stmt_, idx, value));
  }
  void bind(int idx, const std::string &value) {
    check(sqlite3_bind_text(stmt_, idx, value.c_str(),
                            static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }
  void bind(int idx, const std::optional<double> &value) {
    if (value)
      bind(idx, *value);
    else
      check(sqlite3_bind_null(stmt_, idx));
  }

  // true while rows are available
  bool step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
      return true;
    if (rc == SQLITE_DONE)
      return false;
    throw PersistenceFailure(std::string("step failed: ") +
                             sqlite3_errmsg(db_));
  }

  int64_t column_int64(int col) { return sqlite3_column_int64(stmt_, col); }
  double column_double(int col) { return sqlite3_column_double(stmt_, col); }
  std::string column_text(int col) {
    auto text = sqlite3_column_text(stmt_, col);
    return text ? reinterpret_cast<const char *>(text) : "";
  }
  std::optional<double> column_optional_double(int col) {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL)
      return std::nullopt;
    return sqlite3_column_double(stmt_, col);
  }

private:
  void check(int rc) {
    if (rc != SQLITE_OK)
      throw PersistenceFailure(std::string("bind failed: ") +
                               sqlite3_errmsg(db_));
  }

  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;
};

LocalJourney read_row(Statement &stmt) {
  LocalJourney j;
  j.id = stmt.column_int64(0);
  j.time_departure = stmt.column_int64(1);
  j.time_arrival = stmt.column_int64(2);
  j.duration_minutes = static_cast<int>(stmt.column_int64(3));
  j.distance_km = stmt.column_double(4);
  j.detected_transport_type =
      transport_from_string(stmt.column_text(5)).value_or(TransportType::MARCHE);
  j.confidence_avg = static_cast<int>(stmt.column_int64(6));
  j.place_departure = stmt.column_text(7);
  j.place_arrival = stmt.column_text(8);
  j.start_latitude = stmt.column_optional_double(9);
  j.start_longitude = stmt.column_optional_double(10);
  j.end_latitude = stmt.column_optional_double(11);
  j.end_longitude = stmt.column_optional_double(12);
  j.is_gps_based_distance = stmt.column_int64(13) != 0;
  j.gps_points_count = static_cast<int>(stmt.column_int64(14));
  j.status =
      status_from_string(stmt.column_text(15)).value_or(JourneyStatus::PENDING);
  j.created_at = stmt.column_int64(16);
  j.updated_at = stmt.column_int64(17);
  return j;
}

} // namespace

SqliteJourneyStore::SqliteJourneyStore(const std::string &path,
                                       std::shared_ptr<Clock> clock)
    : path_(path), clock_(std::move(clock)), logger_(Logger::get("store")) {
  if (path_ != ":memory:") {
    auto parent = std::filesystem::path(path_).parent_path();
    std::error_code ec;
    if (!parent.empty())
      std::filesystem::create_directories(parent, ec);
    if (ec)
      throw PersistenceFailure("cannot create " + parent.string() + ": " +
                               ec.message());
  }

  int flags =
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw PersistenceFailure("open failed: " + err);
  }

  try {
    sqlite3_busy_timeout(db_, 2000);
    if (path_ != ":memory:")
      exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=FULL");
    create_schema();
  } catch (const PersistenceFailure &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  LOG_INFO(logger_, "journey store opened: {}", path_);
}

SqliteJourneyStore::~SqliteJourneyStore() {
  if (db_)
    sqlite3_close(db_);
}

void SqliteJourneyStore::exec(const char *sql) {
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw PersistenceFailure(msg);
  }
}

void SqliteJourneyStore::create_schema() {
  exec(R"SQL(
      CREATE TABLE IF NOT EXISTS local_journeys (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        time_departure INTEGER NOT NULL,
        time_arrival INTEGER NOT NULL,
        duration_minutes INTEGER NOT NULL,
        distance_km REAL NOT NULL,
        detected_transport_type TEXT NOT NULL,
        confidence_avg INTEGER NOT NULL,
        place_departure TEXT NOT NULL,
        place_arrival TEXT NOT NULL,
        start_latitude REAL,
        start_longitude REAL,
        end_latitude REAL,
        end_longitude REAL,
        is_gps_based_distance INTEGER NOT NULL,
        gps_points_count INTEGER NOT NULL,
        status TEXT NOT NULL DEFAULT 'PENDING',
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL
      )
    )SQL");
  exec("CREATE INDEX IF NOT EXISTS idx_local_journeys_status "
       "ON local_journeys(status)");
}

int64_t SqliteJourneyStore::insert(const LocalJourney &j) {
  static const char *SQL = R"SQL(
      INSERT INTO local_journeys
        (time_departure, time_arrival, duration_minutes, distance_km,
         detected_transport_type, confidence_avg, place_departure,
         place_arrival, start_latitude, start_longitude, end_latitude,
         end_longitude, is_gps_based_distance, gps_points_count, status,
         created_at, updated_at)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 'PENDING', ?, ?)
    )SQL";

  std::lock_guard<std::mutex> lock(mutex_);
  int64_t now = clock_->now_ms();

  Statement stmt(db_, SQL);
  stmt.bind(1, j.time_departure);
  stmt.bind(2, j.time_arrival);
  stmt.bind(3, j.duration_minutes);
  stmt.bind(4, j.distance_km);
  stmt.bind(5, std::string(transport_to_string(j.detected_transport_type)));
  stmt.bind(6, j.confidence_avg);
  stmt.bind(7, j.place_departure);
  stmt.bind(8, j.place_arrival);
  stmt.bind(9, j.start_latitude);
  stmt.bind(10, j.start_longitude);
  stmt.bind(11, j.end_latitude);
  stmt.bind(12, j.end_longitude);
  stmt.bind(13, j.is_gps_based_distance ? 1 : 0);
  stmt.bind(14, j.gps_points_count);
  stmt.bind(15, now);
  stmt.bind(16, now);
  stmt.step();

  int64_t id = sqlite3_last_insert_rowid(db_);
  LOG_INFO(logger_, "journey {} inserted ({}, {:.2f} km, {} min)", id,
           transport_to_string(j.detected_transport_type), j.distance_km,
           j.duration_minutes);
  return id;
}

std::optional<LocalJourney> SqliteJourneyStore::get(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, std::string("SELECT ") + kColumns +
                          " FROM local_journeys WHERE id = ?");
  stmt.bind(1, id);
  if (!stmt.step())
    return std::nullopt;
  return read_row(stmt);
}

std::vector<LocalJourney>
SqliteJourneyStore::query_journeys(const std::string &where,
                                   const std::string &status) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql = std::string("SELECT ") + kColumns + " FROM local_journeys";
  if (!where.empty())
    sql += " WHERE " + where;
  sql += " ORDER BY time_departure DESC, id DESC";

  Statement stmt(db_, sql);
  if (!status.empty())
    stmt.bind(1, status);

  std::vector<LocalJourney> out;
  while (stmt.step())
    out.push_back(read_row(stmt));
  return out;
}

std::vector<LocalJourney> SqliteJourneyStore::list_pending() {
  return list_by_status(JourneyStatus::PENDING);
}

std::vector<LocalJourney>
SqliteJourneyStore::list_by_status(JourneyStatus status) {
  return query_journeys("status = ?", status_to_string(status));
}

std::vector<LocalJourney> SqliteJourneyStore::list_all() {
  return query_journeys("", "");
}

int SqliteJourneyStore::count_pending() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_,
                 "SELECT COUNT(*) FROM local_journeys WHERE status = 'PENDING'");
  if (!stmt.step())
    return 0;
  return static_cast<int>(stmt.column_int64(0));
}

bool SqliteJourneyStore::update(int64_t id, const JourneyUpdate &fields) {
  if (fields.distance_km && *fields.distance_km < 0.0)
    throw std::invalid_argument("distance_km must not be negative");

  std::lock_guard<std::mutex> lock(mutex_);

  std::ostringstream sql;
  sql << "UPDATE local_journeys SET updated_at = ?";
  if (fields.transport_type)
    sql << ", detected_transport_type = ?";
  if (fields.distance_km)
    sql << ", distance_km = ?";
  if (fields.place_departure)
    sql << ", place_departure = ?";
  if (fields.place_arrival)
    sql << ", place_arrival = ?";
  // submitted journeys are final
  sql << " WHERE id = ? AND status = 'PENDING'";

  Statement stmt(db_, sql.str());
  int idx = 1;
  stmt.bind(idx++, clock_->now_ms());
  if (fields.transport_type)
    stmt.bind(idx++, std::string(transport_to_string(*fields.transport_type)));
  if (fields.distance_km)
    stmt.bind(idx++, *fields.distance_km);
  if (fields.place_departure)
    stmt.bind(idx++, *fields.place_departure);
  if (fields.place_arrival)
    stmt.bind(idx++, *fields.place_arrival);
  stmt.bind(idx, id);
  stmt.step();

  bool found = sqlite3_changes(db_) > 0;
  if (found)
    LOG_INFO(logger_, "journey {} updated", id);
  else
    LOG_WARN(logger_, "update: journey {} not found or already sent", id);
  return found;
}

bool SqliteJourneyStore::mark_sent(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  {
    Statement stmt(db_, "UPDATE local_journeys SET status = 'SENT', "
                        "updated_at = ? WHERE id = ? AND status <> 'SENT'");
    stmt.bind(1, clock_->now_ms());
    stmt.bind(2, id);
    stmt.step();
    if (sqlite3_changes(db_) > 0) {
      LOG_INFO(logger_, "journey {} marked SENT", id);
      return true;
    }
  }

  Statement exists(db_, "SELECT 1 FROM local_journeys WHERE id = ?");
  exists.bind(1, id);
  if (exists.step()) {
    LOG_DEBUG(logger_, "journey {} already SENT", id);
    return true;
  }
  LOG_WARN(logger_, "mark_sent: journey {} not found", id);
  return false;
}

bool SqliteJourneyStore::remove(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "DELETE FROM local_journeys WHERE id = ?");
  stmt.bind(1, id);
  stmt.step();
  bool found = sqlite3_changes(db_) > 0;
  if (found)
    LOG_INFO(logger_, "journey {} deleted", id);
  return found;
}

} // namespace tripsense
