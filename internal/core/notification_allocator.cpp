#include "notification_allocator.hpp"

#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace notify::core {

using notify::db::model::NotificationRecord;
using notify::observability::IntField;
using notify::observability::StringField;

NotificationAllocator::NotificationAllocator(std::shared_ptr<db::NotificationRepository> repository, RetryPolicy policy)
    : repository_(std::move(repository)), policy_(policy) {
  if (!repository_) {
    throw util::InvalidArgument("notification allocator: repository is required");
  }
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
}

std::optional<NotificationRecord> NotificationAllocator::QueryLast(int64_t user_id, db::Consistency consistency) {
  db::RangeQuery query;
  query.user_id      = user_id;
  query.limit        = 1;
  query.scan_forward = false;
  query.consistency  = consistency;

  auto records = repository_->RangeQuery(query);
  if (records.empty()) {
    return std::nullopt;
  }
  return std::move(records.front());
}

NotificationRecord NotificationAllocator::BuildCandidate(const model::OperationContext& operation, int64_t user_id, const std::string& name,
                                                         const NotificationOptions& options, const std::optional<NotificationRecord>& last) {
  NotificationRecord record;
  record.user_id         = user_id;
  record.notification_id = last.has_value() ? last->notification_id + 1 : 1;
  record.name            = name;
  record.activity_id     = options.activity_id;
  record.viewpoint_id    = options.viewpoint_id;

  if (options.seq_num_pair.has_value()) {
    record.update_seq = options.seq_num_pair->update_seq;
    if (options.seq_num_pair->viewed_seq.has_value() && operation.user_id == user_id) {
      record.viewed_seq = options.seq_num_pair->viewed_seq;
    }
  }

  record.badge            = (last.has_value() ? last->badge : 0) + (options.inc_badge ? 1 : 0);
  record.timestamp_ms     = operation.timestamp_ms;
  record.sender_id        = operation.user_id;
  record.sender_device_id = operation.device_id;
  record.op_id            = operation.operation_id;
  return record;
}

CreateAttempt NotificationAllocator::AttemptCreate(const NotificationRecord& record) {
  auto result = repository_->InsertIfAbsent(record);
  if (result) {
    return {AttemptStatus::Committed, record, {}};
  }
  if (result.code == db::ErrorCode::Conflict) {
    return {AttemptStatus::Conflict, std::nullopt, std::move(result.message)};
  }
  if (db::IsTransient(result.code)) {
    return {AttemptStatus::TransientError, std::nullopt, std::string(db::ToString(result.code)) + ": " + result.message};
  }
  return {AttemptStatus::Fatal, std::nullopt, std::string(db::ToString(result.code)) + ": " + result.message};
}

NotificationRecord NotificationAllocator::CreateForUser(const model::OperationContext& operation, int64_t user_id, const std::string& name,
                                                        const NotificationOptions& options) {
  if (user_id <= 0) {
    throw util::InvalidArgument("create notification: user id must be positive, got " + std::to_string(user_id));
  }
  if (name.empty()) {
    throw util::InvalidArgument("create notification: name must not be empty");
  }

  // Encoded once, before any write, so encoding failures never leave a partial attempt.
  std::optional<std::string> invalidate;
  if (options.invalidate.has_value()) {
    invalidate = model::EncodeInvalidation(*options.invalidate);
  }

  auto          consistency  = options.consistency;
  AttemptStatus last_failure = AttemptStatus::Conflict;
  std::string   last_message;

  for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    const auto last      = QueryLast(user_id, consistency);
    auto       candidate = BuildCandidate(operation, user_id, name, options, last);
    candidate.invalidate = invalidate;

    auto outcome = AttemptCreate(candidate);
    switch (outcome.status) {
      case AttemptStatus::Committed:
        NOTIFY_LOG_DEBUG("notification created", {IntField("user_id", user_id), IntField("notification_id", candidate.notification_id),
                                                  StringField("name", name), IntField("badge", candidate.badge),
                                                  IntField("attempt", attempt)});
        return std::move(*outcome.record);

      case AttemptStatus::Conflict:
        // The read may have missed the real last record; read strongly from now on.
        NOTIFY_LOG_INFO("notification id already in use", {IntField("user_id", user_id), IntField("notification_id", candidate.notification_id),
                                                           IntField("attempt", attempt)});
        consistency = db::Consistency::Strong;
        break;

      case AttemptStatus::TransientError:
        NOTIFY_LOG_WARN("notification store transient failure", {IntField("user_id", user_id),
                                                                 IntField("notification_id", candidate.notification_id),
                                                                 IntField("attempt", attempt), StringField("error", outcome.message)});
        break;

      case AttemptStatus::Fatal:
        NOTIFY_LOG_ERROR("notification store failure", {IntField("user_id", user_id), IntField("notification_id", candidate.notification_id),
                                                        StringField("error", outcome.message)});
        throw util::StoreError("create notification for user " + std::to_string(user_id) + ": " + outcome.message);
    }

    last_failure = outcome.status;
    last_message = std::move(outcome.message);

    if (attempt < policy_.max_attempts) {
      const auto delay = policy_.BackoffFor(attempt);
      if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
      }
    }
  }

  NOTIFY_LOG_ERROR("notification allocation gave up", {IntField("user_id", user_id), IntField("attempts", policy_.max_attempts),
                                                       StringField("last_error", last_message)});

  const std::string detail = "create notification for user " + std::to_string(user_id) + ": gave up after " +
                             std::to_string(policy_.max_attempts) + " attempts: " + last_message;
  if (last_failure == AttemptStatus::TransientError) {
    throw util::StoreUnavailable(detail);
  }
  throw util::ContentionExceeded(detail);
}

bool NotificationAllocator::TryClearBadge(int64_t user_id, int64_t device_id, int64_t notification_id) {
  if (user_id <= 0 || notification_id <= 0) {
    throw util::InvalidArgument("clear badge: user id and notification id must be positive");
  }

  NotificationRecord record;
  record.user_id          = user_id;
  record.notification_id  = notification_id;
  record.name             = kClearBadgesName;
  record.timestamp_ms     = util::ToUnixMillis(util::Now());
  record.sender_id        = user_id;
  record.sender_device_id = device_id;
  record.badge            = 0;

  auto outcome = AttemptCreate(record);
  switch (outcome.status) {
    case AttemptStatus::Committed:
      return true;

    case AttemptStatus::Conflict:
      NOTIFY_LOG_INFO("clear_badges id already in use", {IntField("user_id", user_id), IntField("notification_id", notification_id)});
      return false;

    case AttemptStatus::TransientError:
      throw util::StoreUnavailable("clear badge for user " + std::to_string(user_id) + ": " + outcome.message);

    case AttemptStatus::Fatal:
      break;
  }
  throw util::StoreError("clear badge for user " + std::to_string(user_id) + ": " + outcome.message);
}

} // namespace notify::core
