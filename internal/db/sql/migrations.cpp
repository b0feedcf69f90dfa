#include "migrations.hpp"

#include <algorithm>

#include "internal/db/sql/sql_queries.hpp"

namespace backupmon::db::sql {

const std::vector<ColumnMigration>& AdditiveColumns() {
  static const std::vector<ColumnMigration> kColumns = {
      {"volume_bytes", "INTEGER DEFAULT 0"},
      {"error_category", "TEXT"},
      {"error_message", "TEXT"},
  };
  return kColumns;
}

std::vector<std::string> RunMigrations(MigrationExecutor& executor) {
  executor.ExecuteSQL(CREATE_BACKUPS);
  executor.ExecuteSQL(CREATE_TIMESTAMP_INDEX);

  const auto existing = executor.TableColumns("backups");

  std::vector<std::string> added;
  for (const auto& migration : AdditiveColumns()) {
    if (std::find(existing.begin(), existing.end(), migration.column) != existing.end()) {
      continue;
    }
    executor.ExecuteSQL("ALTER TABLE backups ADD COLUMN " + migration.column + " " + migration.definition + ";");
    added.push_back(migration.column);
  }
  return added;
}

} // namespace backupmon::db::sql
