#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "internal/core/notification_allocator.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using namespace std::chrono_literals;
using notify::core::NotificationAllocator;
using notify::core::NotificationOptions;
using notify::core::RetryPolicy;
using notify::db::Consistency;
using notify::db::RangeQuery;
using notify::db::memory::MemoryOptions;
using notify::db::memory::MemoryRepository;
using notify::model::OperationContext;

constexpr int kThreads        = 8;
constexpr int kCallsPerThread = 50;

RetryPolicy Patient() {
  RetryPolicy policy;
  policy.max_attempts    = 100000;
  policy.initial_backoff = 0ms;
  policy.max_backoff     = 1ms;
  return policy;
}

void VerifyRacingWritersGetDistinctIds(uint32_t eventual_read_lag) {
  MemoryOptions options;
  options.eventual_read_lag = eventual_read_lag;
  auto repo = std::make_shared<MemoryRepository>(options);
  NotificationAllocator allocator(repo, Patient());

  const int64_t     user = 77;
  std::atomic<bool> go{false};
  std::vector<std::vector<int64_t>> committed(kThreads);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      OperationContext op;
      op.user_id      = 1000 + t;
      op.device_id    = t;
      op.operation_id = "op-" + std::to_string(t);

      NotificationOptions inc;
      inc.inc_badge = true;

      while (!go.load()) std::this_thread::yield();
      for (int i = 0; i < kCallsPerThread; ++i) {
        committed[t].push_back(allocator.CreateForUser(op, user, "share", inc).notification_id);
      }
    });
  }
  go.store(true);
  for (auto& thread : threads) thread.join();

  std::set<int64_t> distinct;
  size_t            total = 0;
  for (const auto& ids : committed) {
    total += ids.size();
    distinct.insert(ids.begin(), ids.end());
  }
  assert(total == static_cast<size_t>(kThreads * kCallsPerThread));
  assert(distinct.size() == total && "every committed id is unique");

  RangeQuery all;
  all.user_id     = user;
  all.consistency = Consistency::Strong;
  auto records    = repo->RangeQuery(all);
  assert(records.size() == total);

  // ids are handed out as last + 1, so the committed set has no holes here
  assert(records.front().notification_id == 1);
  assert(records.back().notification_id == static_cast<int64_t>(total));

  for (size_t i = 1; i < records.size(); ++i) {
    assert(records[i].badge >= records[i - 1].badge);
  }
  assert(records.back().badge >= 1);
}

void VerifyRacingClearBadgeHasOneWinner() {
  auto repo = std::make_shared<MemoryRepository>();
  NotificationAllocator allocator(repo, Patient());

  std::atomic<bool> go{false};
  std::atomic<int>  winners{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      while (!go.load()) std::this_thread::yield();
      if (allocator.TryClearBadge(55, t, 5)) winners.fetch_add(1);
    });
  }
  go.store(true);
  for (auto& thread : threads) thread.join();

  assert(winners.load() == 1);

  auto last = allocator.QueryLast(55, Consistency::Strong);
  assert(last.has_value());
  assert(last->notification_id == 5 && last->badge == 0);
}

} // namespace

int main() {
  VerifyRacingWritersGetDistinctIds(0);
  VerifyRacingWritersGetDistinctIds(3);
  VerifyRacingClearBadgeHasOneWinner();

  std::cout << "notify_unit_allocator_concurrency: pass\n";
  return 0;
}
