#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace backupmon::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  std::vector<std::string> EnsureSchema() override;

  Result InsertIfAbsent(Transaction&, const model::BackupRecord&) override;
  std::vector<model::BackupRecord> ListRecent(Transaction&, uint64_t limit) override;
  std::vector<model::BackupRecord> ListSince(Transaction&, const std::string& since) override;
  std::vector<model::BackupRecord> ListFailures(Transaction&, uint64_t limit) override;
  Result DeleteOlderThan(Transaction&, const std::string& cutoff, uint64_t& deleted) override;

private:
  std::shared_ptr<SqlitePool> pool_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
