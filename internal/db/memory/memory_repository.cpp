#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace backupmon::db::memory {

namespace {

// Oldest first; stable so equal timestamps keep insertion order.
std::vector<model::BackupRecord> Chronological(std::vector<model::BackupRecord> records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const model::BackupRecord& a, const model::BackupRecord& b) { return a.timestamp < b.timestamp; });
  return records;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, /*read_only=*/false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, /*read_only=*/true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::vector<std::string> MemoryRepository::EnsureSchema() {
  return {};
}

Result MemoryRepository::InsertIfAbsent(Transaction& t, const model::BackupRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.backup_ids.contains(r.backup_id)) return Result::Err(ErrorCode::AlreadyExists, "backup_id already stored: " + r.backup_id);
  s.backup_ids.insert(r.backup_id);
  s.records.push_back(r);
  return Result::Ok();
}

std::vector<model::BackupRecord> MemoryRepository::ListRecent(Transaction& t, uint64_t limit) {
  auto sorted = Chronological(TX(t).View().records);
  if (sorted.size() > limit) {
    sorted.erase(sorted.begin(), sorted.end() - static_cast<std::ptrdiff_t>(limit));
  }
  return sorted;
}

std::vector<model::BackupRecord> MemoryRepository::ListSince(Transaction& t, const std::string& since) {
  std::vector<model::BackupRecord> out;
  for (const auto& r : TX(t).View().records)
    if (r.timestamp >= since) out.push_back(r);
  return Chronological(std::move(out));
}

std::vector<model::BackupRecord> MemoryRepository::ListFailures(Transaction& t, uint64_t limit) {
  std::vector<model::BackupRecord> failed;
  for (const auto& r : TX(t).View().records)
    if (!r.success) failed.push_back(r);

  auto sorted = Chronological(std::move(failed));
  std::reverse(sorted.begin(), sorted.end());
  if (sorted.size() > limit) sorted.resize(limit);
  return sorted;
}

Result MemoryRepository::DeleteOlderThan(Transaction& t, const std::string& cutoff, uint64_t& deleted) {
  auto& s = TX(t).Mutable();

  const auto first_evicted = std::stable_partition(s.records.begin(), s.records.end(),
                                                   [&](const model::BackupRecord& r) { return r.timestamp >= cutoff; });
  deleted = static_cast<uint64_t>(std::distance(first_evicted, s.records.end()));
  for (auto it = first_evicted; it != s.records.end(); ++it) {
    s.backup_ids.erase(it->backup_id);
  }
  s.records.erase(first_evicted, s.records.end());
  return Result::Ok();
}

} // namespace backupmon::db::memory
