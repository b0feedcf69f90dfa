#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace backupmon::db::memory {

/*
  Transaction = snapshot + write set

  Write transactions serialize on the repository's writer mutex, the
  equivalent of SQLite's BEGIN IMMEDIATE. Read transactions only copy.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_lock_;
  MemoryRepository::State      working_;
  bool                         read_only_ = false;
  bool                         committed_ = false;
};

} // namespace backupmon::db::memory
