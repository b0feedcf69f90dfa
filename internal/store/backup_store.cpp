#include "backup_store.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace backupmon::store {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  throw util::StorageError(message + " (" + db::ToString(result.code) + ")");
}

// true = inserted, false = duplicate
bool InsertOne(db::Repository& repository, db::Transaction& tx, const db::model::BackupRecord& record) {
  const auto result = repository.InsertIfAbsent(tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) return false;
  ThrowIfDbError(result, "insert backup " + record.backup_id);
  return true;
}

} // namespace

BackupStore::BackupStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) throw std::invalid_argument("backup store requires a repository");
}

std::vector<std::string> BackupStore::EnsureSchema() {
  return repository_->EnsureSchema();
}

bool BackupStore::UpsertIfAbsent(const db::model::BackupRecord& record) {
  auto       tx       = repository_->Begin();
  const bool inserted = InsertOne(*repository_, *tx, record);
  tx->Commit();
  return inserted;
}

uint64_t BackupStore::UpsertAllIfAbsent(const std::vector<db::model::BackupRecord>& records) {
  if (records.empty()) return 0;

  auto     tx       = repository_->Begin();
  uint64_t inserted = 0;
  for (const auto& record : records) {
    if (InsertOne(*repository_, *tx, record)) ++inserted;
  }
  tx->Commit();
  return inserted;
}

std::vector<db::model::BackupRecord> BackupStore::QueryRecent(uint64_t limit) {
  auto tx      = repository_->BeginRead();
  auto records = repository_->ListRecent(*tx, limit);
  tx->Commit();
  return records;
}

std::vector<db::model::BackupRecord> BackupStore::QueryWindow(const std::string& since) {
  auto tx      = repository_->BeginRead();
  auto records = repository_->ListSince(*tx, since);
  tx->Commit();
  return records;
}

std::vector<db::model::BackupRecord> BackupStore::QueryFailures(uint64_t limit) {
  auto tx      = repository_->BeginRead();
  auto records = repository_->ListFailures(*tx, limit);
  tx->Commit();
  return records;
}

uint64_t BackupStore::EvictOlderThan(const std::string& cutoff) {
  auto     tx      = repository_->Begin();
  uint64_t deleted = 0;
  ThrowIfDbError(repository_->DeleteOlderThan(*tx, cutoff, deleted), "evict backups older than " + cutoff);
  tx->Commit();
  return deleted;
}

} // namespace backupmon::store
