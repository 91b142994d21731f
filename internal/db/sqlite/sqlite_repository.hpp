#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"

namespace notify::db::sqlite {

/*
  SQLite is a single authoritative copy, so every read is Strong
  regardless of the requested consistency.
*/
class SqliteRepository final : public db::NotificationRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::vector<model::NotificationRecord> RangeQuery(const db::RangeQuery& query) override;
  Result InsertIfAbsent(const model::NotificationRecord& record) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static Result Translate(sqlite3* db, int rc);
};

}
