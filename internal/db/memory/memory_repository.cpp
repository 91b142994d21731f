#include "memory_repository.hpp"

#include <algorithm>

namespace notify::db::memory {

namespace {

bool InRange(const db::RangeQuery& q, int64_t id) {
  if (q.start_id.has_value() && id < *q.start_id) return false;
  if (q.end_id.has_value() && id > *q.end_id) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

MemoryRepository::MemoryRepository(MemoryOptions options) : options_(options) {
}

std::vector<model::NotificationRecord> MemoryRepository::RangeQuery(const db::RangeQuery& q) {
  std::vector<model::NotificationRecord> out;

  std::scoped_lock lock(mutex_);
  const auto it = partitions_.find(q.user_id);
  if (it == partitions_.end()) {
    return out;
  }
  const auto& p = it->second;

  const bool lagging = q.consistency == Consistency::Eventual && options_.eventual_read_lag > 0;
  auto visible = [&](int64_t id) {
    return !lagging || std::find(p.recent.begin(), p.recent.end(), id) == p.recent.end();
  };

  auto take = [&](const model::NotificationRecord& r) {
    if (!InRange(q, r.notification_id) || !visible(r.notification_id)) return true;
    out.push_back(r);
    return q.limit == 0 || out.size() < q.limit;
  };

  if (q.scan_forward) {
    auto first = q.start_id.has_value() ? p.records.lower_bound(*q.start_id) : p.records.begin();
    for (auto e = first; e != p.records.end(); ++e) {
      if (!take(e->second)) break;
    }
  } else {
    auto last = q.end_id.has_value() ? p.records.upper_bound(*q.end_id) : p.records.end();
    for (auto e = std::make_reverse_iterator(last); e != p.records.rend(); ++e) {
      if (!take(e->second)) break;
    }
  }
  return out;
}

Result MemoryRepository::InsertIfAbsent(const model::NotificationRecord& r) {
  std::scoped_lock lock(mutex_);
  auto& p = partitions_[r.user_id];
  if (p.records.contains(r.notification_id)) {
    return Result::Err(ErrorCode::Conflict, "notification " + std::to_string(r.notification_id) + " already exists");
  }
  p.records.emplace(r.notification_id, r);

  if (options_.eventual_read_lag > 0) {
    p.recent.push_back(r.notification_id);
    while (p.recent.size() > options_.eventual_read_lag) p.recent.pop_front();
  }
  return Result::Ok();
}

} // namespace notify::db::memory
