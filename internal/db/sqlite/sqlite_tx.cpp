#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace backupmon::db::sqlite {

SqliteTransaction::SqliteTransaction(const std::shared_ptr<SqlitePool>& pool, Mode mode) : db_(pool->Acquire()) {
  db_->Exec(mode == Mode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      BACKUPMON_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace backupmon::db::sqlite
