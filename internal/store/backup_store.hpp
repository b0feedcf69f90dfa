#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace backupmon::store {

/*
  BackupStore

  Operation-level facade over db::Repository. Every call opens and
  finishes its own transaction, so callers never hold a connection.

  Failure model:
    duplicate backup_id  -> reported as "not inserted"
    any other db error   -> util::StorageError
*/
class BackupStore {
 public:
  explicit BackupStore(std::shared_ptr<db::Repository> repository);

  // Idempotent, additive-only. Returns the columns that were added.
  std::vector<std::string> EnsureSchema();

  bool UpsertIfAbsent(const db::model::BackupRecord& record);

  // All-or-nothing batch insert in one write transaction.
  // Returns how many records were newly inserted.
  uint64_t UpsertAllIfAbsent(const std::vector<db::model::BackupRecord>& records);

  std::vector<db::model::BackupRecord> QueryRecent(uint64_t limit);
  std::vector<db::model::BackupRecord> QueryWindow(const std::string& since);
  std::vector<db::model::BackupRecord> QueryFailures(uint64_t limit);

  uint64_t EvictOlderThan(const std::string& cutoff);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace backupmon::store
