#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace backupmon::db::memory {

class MemoryTransaction;

/*
  Process-local backend with the same ordering and uniqueness rules as
  SQLite. Used by tests and when the config selects database.memory.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  std::vector<std::string> EnsureSchema() override;

  Result InsertIfAbsent(Transaction&, const model::BackupRecord&) override;
  std::vector<model::BackupRecord> ListRecent(Transaction&, uint64_t limit) override;
  std::vector<model::BackupRecord> ListSince(Transaction&, const std::string& since) override;
  std::vector<model::BackupRecord> ListFailures(Transaction&, uint64_t limit) override;
  Result DeleteOlderThan(Transaction&, const std::string& cutoff, uint64_t& deleted) override;

private:
  friend class MemoryTransaction;

  struct State {
    // insertion order; ties on timestamp resolve by position
    std::vector<model::BackupRecord> records;
    std::unordered_set<std::string> backup_ids;
  };

  std::mutex mutex_;
  // held by write transactions for their whole lifetime
  std::mutex writer_mutex_;
  State committed_;
};

}
