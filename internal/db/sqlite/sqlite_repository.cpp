#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace backupmon::db::sqlite {

using backupmon::db::ErrorCode;
using backupmon::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s.has_value()) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Column order follows sql::SELECT_* statements.
static model::BackupRecord ReadRecord(sqlite3_stmt* st) {
    model::BackupRecord r;
    r.timestamp = ColText(st, 0);
    r.backup_id = ColText(st, 1);
    r.success = sqlite3_column_int(st, 2) != 0;
    r.duration_total = ColU64(st, 3);
    r.duration_snapshot = ColU64(st, 4);
    r.duration_archive = ColU64(st, 5);
    r.duration_volumes = ColU64(st, 6);
    r.duration_upload = ColU64(st, 7);
    r.size_bytes = ColU64(st, 8);
    r.volume_bytes = ColU64(st, 9);
    r.error_category = ColOptionalText(st, 10);
    r.error_message = ColOptionalText(st, 11);
    return r;
}

// Steps a prepared SELECT to completion and finalizes it.
static std::vector<model::BackupRecord> ReadAll(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::BackupRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadRecord(st));
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
    }
    return out;
}

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
public:
    explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {}

    void ExecuteSQL(const std::string& sql) override { db_.Exec(sql); }

    std::vector<std::string> TableColumns(const std::string& table) override {
        return db_.TableColumns(table);
    }

private:
    SqliteDB& db_;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(pool_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(pool_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Schema
// ------------------------------------------------------------------

std::vector<std::string> SqliteRepository::EnsureSchema() {
    SqliteTransaction tx(pool_, SqliteTransaction::Mode::kWrite);

    SqliteMigrationExecutor executor(tx.Connection());
    auto added = sql::RunMigrations(executor);

    tx.Commit();
    return added;
}

// ------------------------------------------------------------------
// Backup records
// ------------------------------------------------------------------

Result SqliteRepository::InsertIfAbsent(Transaction& t, const model::BackupRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_IF_ABSENT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.timestamp);
    BindText(st, 2, r.backup_id);
    sqlite3_bind_int(st, 3, r.success ? 1 : 0);
    BindU64(st, 4, r.duration_total);
    BindU64(st, 5, r.duration_snapshot);
    BindU64(st, 6, r.duration_archive);
    BindU64(st, 7, r.duration_volumes);
    BindU64(st, 8, r.duration_upload);
    BindU64(st, 9, r.size_bytes);
    BindU64(st, 10, r.volume_bytes);
    BindOptionalText(st, 11, r.error_category);
    BindOptionalText(st, 12, r.error_message);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) return Translate(db, rc);

    // ON CONFLICT DO NOTHING reports success; zero changes means the id existed.
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::AlreadyExists, "backup_id already stored: " + r.backup_id);

    return Result::Ok();
}

std::vector<model::BackupRecord> SqliteRepository::ListRecent(Transaction& t, uint64_t limit) {
    auto& conn = TX(t).Connection();

    sqlite3_stmt* st = conn.Prepare(sql::SELECT_RECENT);
    BindU64(st, 1, limit);

    auto out = ReadAll(conn.Handle(), st);
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<model::BackupRecord> SqliteRepository::ListSince(Transaction& t, const std::string& since) {
    auto& conn = TX(t).Connection();

    sqlite3_stmt* st = conn.Prepare(sql::SELECT_SINCE);
    BindText(st, 1, since);

    return ReadAll(conn.Handle(), st);
}

std::vector<model::BackupRecord> SqliteRepository::ListFailures(Transaction& t, uint64_t limit) {
    auto& conn = TX(t).Connection();

    sqlite3_stmt* st = conn.Prepare(sql::SELECT_FAILURES);
    BindU64(st, 1, limit);

    return ReadAll(conn.Handle(), st);
}

Result SqliteRepository::DeleteOlderThan(Transaction& t, const std::string& cutoff, uint64_t& deleted) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_OLDER_THAN, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, cutoff);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) return Translate(db, rc);

    deleted = static_cast<uint64_t>(sqlite3_changes(db));
    return Result::Ok();
}

}
