#pragma once

#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/notification_record.hpp"

namespace notify::db {

/*
  Notification store abstraction.

  CRITICAL GUARANTEES:

  - InsertIfAbsent is atomic: of any number of concurrent inserts for
    the same (user_id, notification_id), exactly one returns OK and the
    rest return ErrorCode::Conflict with no side effect
  - Conflict is never reported for any other failure
  - RangeQuery results are ordered by notification_id in the requested
    direction
  - Records are never modified after a successful insert

  Allocation correctness depends entirely on InsertIfAbsent; callers
  hold no locks.
*/

class NotificationRepository {
 public:
  virtual ~NotificationRepository() = default;

  // Throws std::runtime_error on store failure.
  virtual std::vector<model::NotificationRecord> RangeQuery(const db::RangeQuery& query) = 0;

  virtual Result InsertIfAbsent(const model::NotificationRecord& record) = 0;
};

} // namespace notify::db
