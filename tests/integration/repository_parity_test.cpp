#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/notification_allocator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"

#if NOTIFY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if NOTIFY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using namespace std::chrono_literals;
using notify::core::NotificationAllocator;
using notify::core::NotificationOptions;
using notify::core::RetryPolicy;
using notify::core::SeqNumPair;
using notify::db::Consistency;
using notify::db::ErrorCode;
using notify::db::NotificationRepository;
using notify::db::RangeQuery;
using notify::db::memory::MemoryRepository;
using notify::db::model::NotificationRecord;
using notify::model::OperationContext;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                                   name;
  std::function<std::shared_ptr<NotificationRepository>()>      make_repository;
  std::function<bool()>                                         supports_restart;
  std::function<void(std::shared_ptr<NotificationRepository>&)> restart;
  std::function<void()>                                         cleanup;
};

// Postgres keeps rows between runs, so every run works on fresh user ids.
int64_t UserBase() {
  return static_cast<int64_t>(NowMs() % 1000000000ULL) * 100;
}

NotificationRecord MakeRecord(int64_t user_id, int64_t notification_id) {
  NotificationRecord r;
  r.user_id          = user_id;
  r.notification_id  = notification_id;
  r.name             = "share";
  r.timestamp_ms     = NowMs();
  r.sender_id        = 9;
  r.sender_device_id = 4;
  r.op_id            = "op-" + std::to_string(notification_id);
  r.badge            = notification_id;
  return r;
}

RangeQuery AllFor(int64_t user_id) {
  RangeQuery q;
  q.user_id     = user_id;
  q.consistency = Consistency::Strong;
  return q;
}

RetryPolicy Patient() {
  RetryPolicy policy;
  policy.max_attempts    = 100000;
  policy.initial_backoff = 0ms;
  policy.max_backoff     = 1ms;
  return policy;
}

void VerifyInsertConflict(NotificationRepository& repo, int64_t user) {
  auto first = MakeRecord(user, 1);
  assert(repo.InsertIfAbsent(first));

  auto loser   = MakeRecord(user, 1);
  loser.name   = "clear_badges";
  loser.badge  = 0;
  auto result  = repo.InsertIfAbsent(loser);
  assert(!result);
  assert(result.code == ErrorCode::Conflict);

  auto rows = repo.RangeQuery(AllFor(user));
  assert(rows.size() == 1);
  assert(rows[0].name == "share");
  assert(rows[0].badge == 1);
}

void VerifyScans(NotificationRepository& repo, int64_t user) {
  for (int64_t id = 1; id <= 5; ++id) {
    assert(repo.InsertIfAbsent(MakeRecord(user, id)));
  }

  auto asc = repo.RangeQuery(AllFor(user));
  assert(asc.size() == 5);
  assert(asc.front().notification_id == 1 && asc.back().notification_id == 5);

  RangeQuery last = AllFor(user);
  last.scan_forward = false;
  last.limit        = 1;
  auto desc         = repo.RangeQuery(last);
  assert(desc.size() == 1 && desc[0].notification_id == 5);

  RangeQuery window = AllFor(user);
  window.start_id     = 2;
  window.end_id       = 4;
  window.scan_forward = false;
  auto bounded        = repo.RangeQuery(window);
  assert(bounded.size() == 3);
  assert(bounded[0].notification_id == 4 && bounded[2].notification_id == 2);

  assert(repo.RangeQuery(AllFor(user + 1)).empty());
}

void VerifyOptionalColumns(NotificationRepository& repo, int64_t user) {
  auto bare = MakeRecord(user, 1);
  assert(repo.InsertIfAbsent(bare));

  auto full         = MakeRecord(user, 2);
  full.invalidate   = R"({"viewpoints":[{"viewpoint_id":"vp1"}]})";
  full.activity_id  = "a-77";
  full.viewpoint_id = "vp1";
  full.update_seq   = 12;
  full.viewed_seq   = 10;
  assert(repo.InsertIfAbsent(full));

  auto rows = repo.RangeQuery(AllFor(user));
  assert(rows.size() == 2);
  assert(rows[0] == bare);
  assert(rows[1] == full);
  assert(!rows[0].invalidate.has_value());
  assert(!rows[0].update_seq.has_value());
}

void VerifyAllocatorScenario(const std::shared_ptr<NotificationRepository>& repo, int64_t user) {
  NotificationAllocator allocator(repo);

  OperationContext op;
  op.user_id      = 1;
  op.device_id    = 2;
  op.operation_id = "op-share";
  op.timestamp_ms = NowMs();

  NotificationOptions share;
  share.inc_badge    = true;
  share.activity_id  = "a1";
  share.viewpoint_id = "vp1";
  share.seq_num_pair = SeqNumPair{.update_seq = 4, .viewed_seq = 3};

  auto first = allocator.CreateForUser(op, user, "share_new", share);
  assert(first.notification_id == 1);
  assert(first.badge == 1);
  assert(first.update_seq == 4);
  assert(!first.viewed_seq.has_value());

  auto second = allocator.CreateForUser(op, user, "post_comment", share);
  assert(second.notification_id == 2);
  assert(second.badge == 2);

  assert(allocator.TryClearBadge(user, 8, 3));
  assert(!allocator.TryClearBadge(user, 8, 3));

  auto last = allocator.QueryLast(user, Consistency::Strong);
  assert(last.has_value());
  assert(last->notification_id == 3);
  assert(last->name == NotificationAllocator::kClearBadgesName);
  assert(last->badge == 0);

  auto third = allocator.CreateForUser(op, user, "share_existing", share);
  assert(third.notification_id == 4);
  assert(third.badge == 1);
}

void VerifyConcurrentAllocation(const std::shared_ptr<NotificationRepository>& repo, int64_t user) {
  constexpr int kThreads = 4;
  constexpr int kCalls   = 20;

  NotificationAllocator allocator(repo, Patient());

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      OperationContext op;
      op.user_id      = 100 + t;
      op.device_id    = t;
      op.operation_id = "op-" + std::to_string(t);
      for (int i = 0; i < kCalls; ++i) {
        (void)allocator.CreateForUser(op, user, "share");
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto rows = repo->RangeQuery(AllFor(user));
  assert(rows.size() == static_cast<size_t>(kThreads * kCalls));

  std::set<int64_t> ids;
  for (const auto& row : rows) ids.insert(row.notification_id);
  assert(ids.size() == rows.size());
  assert(*ids.begin() == 1);
  assert(*ids.rbegin() == kThreads * kCalls);
}

void VerifyRestartDurability(BackendFactory& backend, int64_t user) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    NotificationAllocator allocator(repo);
    OperationContext      op;
    op.user_id      = user;
    op.operation_id = "op-durable";

    NotificationOptions inc;
    inc.inc_badge = true;
    (void)allocator.CreateForUser(op, user, "share", inc);
    (void)allocator.CreateForUser(op, user, "share", inc);
  }

  backend.restart(repo);

  NotificationAllocator allocator(repo);
  auto                  last = allocator.QueryLast(user, Consistency::Strong);
  assert(last.has_value());
  assert(last->notification_id == 2);
  assert(last->badge == 2);
  assert(last->op_id == "op-durable");

  OperationContext op;
  op.user_id = user;
  auto next  = allocator.CreateForUser(op, user, "share");
  assert(next.notification_id == 3);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<NotificationRepository>&) {},
      .cleanup          = []() {},
  };
}

#if NOTIFY_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("notify_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<NotificationRepository> {
    auto db = std::make_shared<notify::db::sqlite::SqliteDB>(db_path);
    db->Exec(notify::db::sql::CREATE_NOTIFICATION_TABLE);
    return std::make_shared<notify::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<NotificationRepository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if NOTIFY_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("NOTIFY_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("NOTIFY_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<NotificationRepository> {
    auto pool = std::make_shared<notify::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      tx.exec(notify::db::sql::CREATE_NOTIFICATION_TABLE);
      tx.commit();
    }
    return std::make_shared<notify::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<NotificationRepository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo = backend.make_repository();
  const auto base = UserBase();

  VerifyInsertConflict(*repo, base + 1);
  VerifyScans(*repo, base + 10);
  VerifyOptionalColumns(*repo, base + 20);
  VerifyAllocatorScenario(repo, base + 30);
  VerifyConcurrentAllocation(repo, base + 40);

  VerifyRestartDurability(backend, base + 50);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if NOTIFY_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if NOTIFY_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres backend: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "notify_integration_repository_parity: pass\n";
  return 0;
}
