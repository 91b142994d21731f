#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace notify::db::model {

/*
  One notification for one user.

  Key: (user_id, notification_id)
    user_id         -> partition key
    notification_id -> sort key, strictly increasing per user

  Records are created once and never updated in place.

  invalidate is stored as JSON text:
    postgres -> text
    sqlite   -> text
    memory   -> string
*/

struct NotificationRecord {
  int64_t user_id         = 0;
  int64_t notification_id = 0;

  std::string name;
  uint64_t    timestamp_ms = 0;

  int64_t     sender_id        = 0;
  int64_t     sender_device_id = 0;
  std::string op_id;

  // unacknowledged notification count carried forward per user
  int64_t badge = 0;

  std::optional<std::string> invalidate;
  std::optional<std::string> activity_id;
  std::optional<std::string> viewpoint_id;

  std::optional<int64_t> update_seq;
  std::optional<int64_t> viewed_seq;

  bool operator==(const NotificationRecord&) const = default;
};

} // namespace notify::db::model
