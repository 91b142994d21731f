#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/retry_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/notification_record.hpp"
#include "internal/model/invalidation.hpp"
#include "internal/model/operation.hpp"

namespace notify::core {

// viewed_seq only lands on the record of the user who ran the operation.
struct SeqNumPair {
  int64_t                update_seq = 0;
  std::optional<int64_t> viewed_seq;
};

struct NotificationOptions {
  std::optional<model::Invalidation> invalidate;
  std::optional<std::string>         activity_id;
  std::optional<std::string>         viewpoint_id;
  std::optional<SeqNumPair>          seq_num_pair;
  bool                               inc_badge   = false;
  db::Consistency                    consistency = db::Consistency::Eventual;
};

enum class AttemptStatus {
  Committed,
  Conflict,        // another writer owns the id
  TransientError,  // busy / io / serialization; safe to try again
  Fatal,
};

struct CreateAttempt {
  AttemptStatus                                status = AttemptStatus::Fatal;
  std::optional<db::model::NotificationRecord> record;  // set when Committed
  std::string                                  message;
};

/*
  NotificationAllocator

  Lock-free per-user id allocation on top of a store with an atomic
  create-if-absent. The allocator keeps no mutable state, so any number
  of threads (or processes sharing the store) may call it for the same
  user at once; the store decides every race.

  Badge values are computed from the predecessor that was read, so two
  racing writers can both carry the same predecessor badge + 1. Badge
  is a best-effort counter and this is accepted.
*/
class NotificationAllocator {
 public:
  static constexpr const char* kClearBadgesName = "clear_badges";

  explicit NotificationAllocator(std::shared_ptr<db::NotificationRepository> repository, RetryPolicy policy = RetryPolicy());

  // Highest-id record for the user, or std::nullopt if there is none.
  // Store failures propagate.
  std::optional<db::model::NotificationRecord> QueryLast(int64_t user_id, db::Consistency consistency = db::Consistency::Eventual);

  /*
    Appends a notification for user_id and returns the committed record.

    Each lost race escalates to Strong reads so a stale "last id" cannot
    cause the same collision twice. Throws:
      util::InvalidArgument     bad user id or empty name
      util::EncodingError       invalidation not serializable
      util::ContentionExceeded  every attempt conflicted
      util::StoreUnavailable    attempts ran out on transient store errors
      util::StoreError          non-retryable store failure
  */
  db::model::NotificationRecord CreateForUser(const model::OperationContext& operation, int64_t user_id, const std::string& name,
                                              const NotificationOptions& options = NotificationOptions());

  /*
    Single conditional create of a "clear_badges" record at a caller
    chosen id. true if this call created it, false if the id was taken.
    Never retries; transient and fatal store failures throw.
  */
  bool TryClearBadge(int64_t user_id, int64_t device_id, int64_t notification_id);

  // One create-if-absent with the store result classified.
  CreateAttempt AttemptCreate(const db::model::NotificationRecord& record);

 private:
  static db::model::NotificationRecord BuildCandidate(const model::OperationContext& operation, int64_t user_id, const std::string& name,
                                                      const NotificationOptions& options,
                                                      const std::optional<db::model::NotificationRecord>& last);

  std::shared_ptr<db::NotificationRepository> repository_;
  RetryPolicy                                 policy_;
};

} // namespace notify::core
