#pragma once

#include <string>
#include <vector>

namespace backupmon::db::sql {

/*
  Backend-agnostic schema evolution.

  Migrations are additive only: columns are added with a default and
  never dropped or renamed, so rows written by an older schema stay
  valid under the newer one.
*/

struct ColumnMigration {
  std::string column;
  std::string definition; // e.g. "INTEGER DEFAULT 0"
};

// Columns added after the first schema release, oldest first.
const std::vector<ColumnMigration>& AdditiveColumns();

/*
  Each backend implements ExecuteSQL() and TableColumns().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual std::vector<std::string> TableColumns(const std::string& table) = 0;
};

/*
  Creates the backups table and index if missing, then adds every
  additive column the table lacks. Idempotent.

  Returns the names of the columns that were added.
*/

std::vector<std::string> RunMigrations(MigrationExecutor& executor);

} // namespace backupmon::db::sql
