#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace notify::db::memory {

struct MemoryOptions {
  // Eventual reads do not observe this many of the most recent inserts
  // per user, mimicking a lagging replica. Strong reads see everything.
  uint32_t eventual_read_lag = 0;
};

class MemoryRepository final : public db::NotificationRepository {
public:
  MemoryRepository();
  explicit MemoryRepository(MemoryOptions options);

  std::vector<model::NotificationRecord> RangeQuery(const db::RangeQuery& query) override;
  Result InsertIfAbsent(const model::NotificationRecord& record) override;

private:
  struct Partition {
    std::map<int64_t, model::NotificationRecord> records;
    // newest last; bounded by eventual_read_lag
    std::deque<int64_t> recent;
  };

  MemoryOptions options_;

  std::mutex mutex_;
  std::unordered_map<int64_t, Partition> partitions_;
};

}
