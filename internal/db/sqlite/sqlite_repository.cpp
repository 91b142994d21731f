#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace notify::db::sqlite {

using notify::db::ErrorCode;
using notify::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s.has_value())
        BindText(st, idx, *s);
    else
        sqlite3_bind_null(st, idx);
}

static void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v.has_value())
        BindI64(st, idx, *v);
    else
        sqlite3_bind_null(st, idx);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI64(st, col);
}

static model::NotificationRecord ReadRow(sqlite3_stmt* st) {
    model::NotificationRecord r;
    r.user_id          = ColI64(st, 0);
    r.notification_id  = ColI64(st, 1);
    r.name             = ColText(st, 2);
    r.timestamp_ms     = static_cast<uint64_t>(ColI64(st, 3));
    r.sender_id        = ColI64(st, 4);
    r.sender_device_id = ColI64(st, 5);
    r.op_id            = ColText(st, 6);
    r.badge            = ColI64(st, 7);
    r.invalidate       = ColOptText(st, 8);
    r.activity_id      = ColOptText(st, 9);
    r.viewpoint_id     = ColOptText(st, 10);
    r.update_seq       = ColOptI64(st, 11);
    r.viewed_seq       = ColOptI64(st, 12);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    // The only keys on the notification table are the primary key, so a
    // key collision is the create-if-absent predicate failing.
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::Conflict, sqlite3_errmsg(db));

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::vector<model::NotificationRecord> SqliteRepository::RangeQuery(const db::RangeQuery& q) {
    std::string sql = std::string("SELECT ") + sql::NOTIFICATION_COLUMNS + " FROM notification WHERE user_id=?";
    if (q.start_id.has_value()) sql += " AND notification_id>=?";
    if (q.end_id.has_value()) sql += " AND notification_id<=?";
    sql += q.scan_forward ? " ORDER BY notification_id ASC" : " ORDER BY notification_id DESC";
    if (q.limit > 0) sql += " LIMIT ?";
    sql += ";";

    sqlite3_stmt* st = db_->Prepare(sql);

    int idx = 1;
    BindI64(st, idx++, q.user_id);
    if (q.start_id.has_value()) BindI64(st, idx++, *q.start_id);
    if (q.end_id.has_value()) BindI64(st, idx++, *q.end_id);
    if (q.limit > 0) BindI64(st, idx++, static_cast<int64_t>(q.limit));

    std::vector<model::NotificationRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }

    if (rc != SQLITE_DONE) {
        auto err = Translate(db_->Handle(), rc);
        sqlite3_finalize(st);
        throw std::runtime_error("sqlite range query for user " + std::to_string(q.user_id) + ": " + err.message);
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Conditional create
// ------------------------------------------------------------------

Result SqliteRepository::InsertIfAbsent(const model::NotificationRecord& r) {
    auto* db = db_->Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_NOTIFICATION, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, r.user_id);
    BindI64(st, 2, r.notification_id);
    BindText(st, 3, r.name);
    BindI64(st, 4, static_cast<int64_t>(r.timestamp_ms));
    BindI64(st, 5, r.sender_id);
    BindI64(st, 6, r.sender_device_id);
    BindText(st, 7, r.op_id);
    BindI64(st, 8, r.badge);
    BindOptText(st, 9, r.invalidate);
    BindOptText(st, 10, r.activity_id);
    BindOptText(st, 11, r.viewpoint_id);
    BindOptI64(st, 12, r.update_seq);
    BindOptI64(st, 13, r.viewed_seq);

    int rc = sqlite3_step(st);
    auto result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

} // namespace notify::db::sqlite
