#pragma once

namespace notify::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  The DDL is written in the SQLite/Postgres common subset. DML uses
  SQLite `?` placeholders; the Postgres backend carries its own `$n`
  variants.
*/

static constexpr const char* CREATE_NOTIFICATION_TABLE =
    "CREATE TABLE IF NOT EXISTS notification ("
    " user_id BIGINT NOT NULL,"
    " notification_id BIGINT NOT NULL,"
    " name TEXT NOT NULL,"
    " timestamp_ms BIGINT NOT NULL,"
    " sender_id BIGINT NOT NULL,"
    " sender_device_id BIGINT NOT NULL,"
    " op_id TEXT NOT NULL,"
    " badge BIGINT NOT NULL,"
    " invalidate TEXT,"
    " activity_id TEXT,"
    " viewpoint_id TEXT,"
    " update_seq BIGINT,"
    " viewed_seq BIGINT,"
    " PRIMARY KEY (user_id, notification_id));";

// Column order shared by every SELECT and the row readers.
static constexpr const char* NOTIFICATION_COLUMNS =
    "user_id,notification_id,name,timestamp_ms,sender_id,sender_device_id,op_id,badge,"
    "invalidate,activity_id,viewpoint_id,update_seq,viewed_seq";

static constexpr const char* INSERT_NOTIFICATION =
    "INSERT INTO notification("
    "user_id,notification_id,name,timestamp_ms,sender_id,sender_device_id,op_id,badge,"
    "invalidate,activity_id,viewpoint_id,update_seq,viewed_seq)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

}
