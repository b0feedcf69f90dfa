#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/store/backup_store.hpp"

namespace {

using backupmon::db::sqlite::SqliteDB;
using backupmon::db::sqlite::SqlitePool;
using backupmon::db::sqlite::SqliteRepository;

std::filesystem::path FreshDatabase(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "backupmon_sqlite_migration_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / name;
  for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(path.string() + suffix);
  return path;
}

// Table layout written by the first release, before volume and error tracking.
void CreateLegacyStore(const std::filesystem::path& path) {
  SqliteDB db(path.string());
  db.Exec(
      "CREATE TABLE backups ("
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
      " created_at TEXT DEFAULT CURRENT_TIMESTAMP);");
  db.Exec(
      "INSERT INTO backups(timestamp,backup_id,success,duration_total,duration_snapshot,duration_archive,"
      "duration_volumes,duration_upload,size_bytes)"
      " VALUES('2026-10-01T02:00:00','legacy-1',1,300,NULL,120,60,100,524288000);");
  db.Exec(
      "INSERT INTO backups(timestamp,backup_id,success,duration_total,size_bytes)"
      " VALUES('2026-10-02T02:00:00','legacy-2',0,12,0);");
}

void TestLegacyStoreGainsColumnsWithDefaults() {
  const auto path = FreshDatabase("legacy.db");
  CreateLegacyStore(path);

  auto store = std::make_shared<backupmon::store::BackupStore>(std::make_shared<SqliteRepository>(std::make_shared<SqlitePool>(path.string())));

  const auto added = store->EnsureSchema();
  assert((added == std::vector<std::string>{"volume_bytes", "error_category", "error_message"}));

  // second startup is a no-op
  assert(store->EnsureSchema().empty());

  const auto rows = store->QueryRecent(10);
  assert(rows.size() == 2);

  assert(rows[0].backup_id == "legacy-1");
  assert(rows[0].timestamp == "2026-10-01T02:00:00");
  assert(rows[0].success);
  assert(rows[0].duration_total == 300);
  assert(rows[0].duration_snapshot == 0);
  assert(rows[0].duration_archive == 120);
  assert(rows[0].size_bytes == 524288000);
  assert(rows[0].volume_bytes == 0);
  assert(!rows[0].error_category.has_value());
  assert(!rows[0].error_message.has_value());

  assert(rows[1].backup_id == "legacy-2");
  assert(!rows[1].success);
  assert(rows[1].duration_total == 12);
  assert(!rows[1].error_category.has_value());

  SqliteDB raw(path.string());
  const auto columns = raw.TableColumns("backups");
  assert(columns.size() == 14);
  assert(columns.back() == "error_message");
}

void TestNewRowsUseMigratedColumns() {
  const auto path = FreshDatabase("legacy_then_insert.db");
  CreateLegacyStore(path);

  auto store = std::make_shared<backupmon::store::BackupStore>(std::make_shared<SqliteRepository>(std::make_shared<SqlitePool>(path.string())));
  store->EnsureSchema();

  backupmon::db::model::BackupRecord failed;
  failed.timestamp      = "2026-10-03T02:00:00";
  failed.backup_id      = "new-1";
  failed.success        = false;
  failed.duration_total = 5;
  failed.volume_bytes   = 42;
  failed.error_category = "upload";
  failed.error_message  = "remote unreachable";

  assert(store->UpsertIfAbsent(failed));
  assert(!store->UpsertIfAbsent(failed));
  assert(!store->UpsertIfAbsent(backupmon::db::model::BackupRecord{"2026-10-04T00:00:00", "legacy-1", true, 1, 0, 0, 0, 0, 1, 0,
                                                                     std::nullopt, std::nullopt}));

  const auto failures = store->QueryFailures(10);
  assert(failures.size() == 2);
  assert(failures[0] == failed);
  assert(failures[1].backup_id == "legacy-2");
}

void TestFreshStoreNeedsNoMigration() {
  const auto path  = FreshDatabase("fresh.db");
  auto       store = std::make_shared<backupmon::store::BackupStore>(std::make_shared<SqliteRepository>(std::make_shared<SqlitePool>(path.string())));

  assert(store->EnsureSchema().empty());
  assert(store->QueryRecent(10).empty());
}

} // namespace

int main() {
  TestLegacyStoreGainsColumnsWithDefaults();
  TestNewRowsUseMigratedColumns();
  TestFreshStoreNeedsNoMigration();

  std::cout << "backupmon_unit_sqlite_schema_migration: pass\n";
  return 0;
}
