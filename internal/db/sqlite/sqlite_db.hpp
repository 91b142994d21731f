#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace notify::db::sqlite {

struct SqliteOptions {
  bool     wal_mode        = true;
  uint32_t busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  Opened in serialized (FULLMUTEX) mode so one handle can be shared by
  every allocator thread; extended result codes are enabled so a
  primary key collision is distinguishable from other constraints.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = SqliteOptions());
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace notify::db::sqlite
