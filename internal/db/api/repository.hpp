#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/backup_record.hpp"

namespace backupmon::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access happens inside a Transaction
  - Reads inside a transaction see its writes
  - InsertIfAbsent is atomic on backup_id: the first row wins,
    later rows with the same id return AlreadyExists
  - Range reads order by timestamp, ties by insertion order

  The DB is the source of truth for retained backup history.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // write transaction (takes the write lock up front)
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // read-only transaction; never waits for a writer
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Schema
  // ---------------------------------------------------------------------

  // Creates or additively migrates the backups table.
  // Returns the columns that had to be added.
  virtual std::vector<std::string> EnsureSchema() = 0;

  // ---------------------------------------------------------------------
  // Backup records
  // ---------------------------------------------------------------------

  virtual Result InsertIfAbsent(Transaction&, const model::BackupRecord&) = 0;

  // Most recent `limit` records, oldest first.
  virtual std::vector<model::BackupRecord> ListRecent(Transaction&, uint64_t limit) = 0;

  // All records with timestamp >= since, oldest first.
  virtual std::vector<model::BackupRecord> ListSince(Transaction&, const std::string& since) = 0;

  // Most recent `limit` failed records, newest first.
  virtual std::vector<model::BackupRecord> ListFailures(Transaction&, uint64_t limit) = 0;

  // Deletes rows with timestamp < cutoff.
  virtual Result DeleteOlderThan(Transaction&, const std::string& cutoff, uint64_t& deleted) = 0;
};

} // namespace backupmon::db
