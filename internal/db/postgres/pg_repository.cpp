#include "pg_repository.hpp"

#include <limits>
#include <stdexcept>

namespace notify::db::postgres {

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<int64_t> OptI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<int64_t>();
}

model::NotificationRecord ReadRow(const pqxx::row& row) {
  model::NotificationRecord r;
  r.user_id          = row[0].as<int64_t>();
  r.notification_id  = row[1].as<int64_t>();
  r.name             = row[2].c_str();
  r.timestamp_ms     = static_cast<uint64_t>(row[3].as<int64_t>());
  r.sender_id        = row[4].as<int64_t>();
  r.sender_device_id = row[5].as<int64_t>();
  r.op_id            = row[6].c_str();
  r.badge            = row[7].as<int64_t>();
  r.invalidate       = OptText(row[8]);
  r.activity_id      = OptText(row[9]);
  r.viewpoint_id     = OptText(row[10]);
  r.update_seq       = OptI64(row[11]);
  r.viewed_seq       = OptI64(row[12]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::vector<model::NotificationRecord> PgRepository::RangeQuery(const db::RangeQuery& q) {
  const int64_t          start = q.start_id.value_or(std::numeric_limits<int64_t>::min());
  const int64_t          end   = q.end_id.value_or(std::numeric_limits<int64_t>::max());
  std::optional<int64_t> limit;
  if (q.limit > 0) limit = static_cast<int64_t>(q.limit);

  auto conn = pool_->Acquire();
  pqxx::work tx(*conn);
  auto res = tx.exec_prepared(q.scan_forward ? "notification_range_asc" : "notification_range_desc", q.user_id, start, end, limit);
  tx.commit();

  std::vector<model::NotificationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row));
  }
  return out;
}

Result PgRepository::InsertIfAbsent(const model::NotificationRecord& r) {
  try {
    auto conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("notification_insert", r.user_id, r.notification_id, r.name, static_cast<int64_t>(r.timestamp_ms), r.sender_id,
                     r.sender_device_id, r.op_id, r.badge, r.invalidate, r.activity_id, r.viewpoint_id, r.update_seq, r.viewed_seq);
    tx.commit();
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::Conflict, e.what());
  } catch (const pqxx::integrity_constraint_violation& e) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  } catch (const pqxx::transaction_rollback& e) {
    // serialization_failure, deadlock_detected
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  } catch (const pqxx::in_doubt_error& e) {
    // commit outcome unknown; retrying could commit a second record
    return Result::Err(ErrorCode::InternalError, e.what());
  } catch (const pqxx::broken_connection& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

} // namespace notify::db::postgres
