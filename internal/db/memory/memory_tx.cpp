#include "memory_tx.hpp"

namespace backupmon::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  if (!read_only_) {
    writer_lock_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);
  }
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

void MemoryTransaction::Commit() {
  if (!read_only_) {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace backupmon::db::memory
