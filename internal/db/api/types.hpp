#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace notify::db {

/*
  Read consistency.

  Eventual: cheaper, may not observe very recent writes.
  Strong:   observes every write that succeeded before the read began.

  Backends with a single authoritative copy (sqlite, postgres) treat
  both levels as Strong.
*/
enum class Consistency {
  Eventual,
  Strong,
};

/*
  Range scan over one user's notifications.

  start_id / end_id bound notification_id inclusively when set.
  limit == 0 means no limit.
*/
struct RangeQuery {
  int64_t                user_id = 0;
  std::optional<int64_t> start_id;
  std::optional<int64_t> end_id;
  std::size_t            limit        = 0;
  bool                   scan_forward = true;
  Consistency            consistency  = Consistency::Eventual;
};

} // namespace notify::db
