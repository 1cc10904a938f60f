#pragma once

#include "storage/local_journey.h"
#include <optional>
#include <vector>

namespace tripsense {

// Durable journey persistence. Every operation is atomic per record and
// reports storage errors as PersistenceFailure.
class JourneyStore {
public:
  virtual ~JourneyStore() = default;

  // Assigns id, created_at and updated_at; status is always PENDING.
  virtual int64_t insert(const LocalJourney &journey) = 0;
  virtual std::optional<LocalJourney> get(int64_t id) = 0;
  virtual std::vector<LocalJourney> list_pending() = 0;
  virtual std::vector<LocalJourney> list_by_status(JourneyStatus status) = 0;
  virtual std::vector<LocalJourney> list_all() = 0;
  virtual int count_pending() = 0;

  // false when the id does not exist or the journey is already SENT
  virtual bool update(int64_t id, const JourneyUpdate &fields) = 0;
  // idempotent: true for a journey that is already SENT
  virtual bool mark_sent(int64_t id) = 0;
  virtual bool remove(int64_t id) = 0;
};

} // namespace tripsense
