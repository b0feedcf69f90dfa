#pragma once

namespace backupmon::db::sql {

/*
  Canonical SQL for the backups table.

  Written in the SQLite dialect. Column order of every SELECT matches
  RECORD_COLUMNS so one row reader serves all queries.
*/

static constexpr const char* CREATE_BACKUPS =
    "CREATE TABLE IF NOT EXISTS backups ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " timestamp TEXT NOT NULL,"
    " backup_id TEXT NOT NULL UNIQUE,"
    " success INTEGER NOT NULL,"
    " duration_total INTEGER NOT NULL,"
    " duration_snapshot INTEGER,"
    " duration_archive INTEGER,"
    " duration_volumes INTEGER,"
    " duration_upload INTEGER,"
    " size_bytes INTEGER NOT NULL,"
    " volume_bytes INTEGER DEFAULT 0,"
    " error_category TEXT,"
    " error_message TEXT,"
    " created_at TEXT DEFAULT CURRENT_TIMESTAMP);";

static constexpr const char* CREATE_TIMESTAMP_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_timestamp ON backups(timestamp);";

#define BACKUPMON_RECORD_COLUMNS                                                                  \
  "timestamp,backup_id,success,duration_total,COALESCE(duration_snapshot,0),"                    \
  "COALESCE(duration_archive,0),COALESCE(duration_volumes,0),COALESCE(duration_upload,0),"       \
  "size_bytes,COALESCE(volume_bytes,0),error_category,error_message"

static constexpr const char* INSERT_IF_ABSENT =
    "INSERT INTO backups(timestamp,backup_id,success,duration_total,duration_snapshot,"
    "duration_archive,duration_volumes,duration_upload,size_bytes,volume_bytes,"
    "error_category,error_message)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(backup_id) DO NOTHING;";

static constexpr const char* SELECT_RECENT =
    "SELECT " BACKUPMON_RECORD_COLUMNS
    " FROM backups ORDER BY timestamp DESC, id DESC LIMIT ?;";

static constexpr const char* SELECT_SINCE =
    "SELECT " BACKUPMON_RECORD_COLUMNS
    " FROM backups WHERE timestamp>=? ORDER BY timestamp ASC, id ASC;";

static constexpr const char* SELECT_FAILURES =
    "SELECT " BACKUPMON_RECORD_COLUMNS
    " FROM backups WHERE success=0 ORDER BY timestamp DESC, id DESC LIMIT ?;";

static constexpr const char* DELETE_OLDER_THAN =
    "DELETE FROM backups WHERE timestamp<?;";

#undef BACKUPMON_RECORD_COLUMNS

}
