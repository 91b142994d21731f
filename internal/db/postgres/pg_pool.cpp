#include "pg_pool.hpp"

namespace notify::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // LIMIT NULL is LIMIT ALL in postgres
  conn.prepare("notification_range_asc",
               "SELECT user_id,notification_id,name,timestamp_ms,sender_id,sender_device_id,op_id,badge,"
               "invalidate,activity_id,viewpoint_id,update_seq,viewed_seq "
               "FROM notification WHERE user_id=$1 AND notification_id>=$2 AND notification_id<=$3 "
               "ORDER BY notification_id ASC LIMIT $4");

  conn.prepare("notification_range_desc",
               "SELECT user_id,notification_id,name,timestamp_ms,sender_id,sender_device_id,op_id,badge,"
               "invalidate,activity_id,viewpoint_id,update_seq,viewed_seq "
               "FROM notification WHERE user_id=$1 AND notification_id>=$2 AND notification_id<=$3 "
               "ORDER BY notification_id DESC LIMIT $4");

  conn.prepare("notification_insert",
               "INSERT INTO notification(user_id,notification_id,name,timestamp_ms,sender_id,sender_device_id,op_id,badge,"
               "invalidate,activity_id,viewpoint_id,update_seq,viewed_seq) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      delete conn;
      --live_connections_;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace notify::db::postgres
