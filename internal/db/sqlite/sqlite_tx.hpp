#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_pool.hpp"

namespace backupmon::db::sqlite {

/*
  SQLite transaction wrapper. Holds its pooled connection until destroyed.

  Write mode uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Read mode uses BEGIN DEFERRED and only ever takes a WAL read snapshot.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kRead, kWrite };

  SqliteTransaction(const std::shared_ptr<SqlitePool>& pool, Mode mode);
  ~SqliteTransaction();

  SqliteDB& Connection() const { return *db_; }
  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
