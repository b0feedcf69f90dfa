#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace backupmon::db::sqlite {

/*
  SqlitePool

  Connection factory used by SqliteRepository.

  Design notes:
  -------------
  - Each transaction gets its own connection, so a reader never
    queues behind the importer's write transaction (WAL mode).
  - Idle connections are reused; at most max_connections are live.
  - ":memory:" databases are per-connection in SQLite, so the pool
    is capped at one connection for them.

  Lifetime:
    Repository owns shared_ptr<SqlitePool>
    Transaction acquires shared_ptr<SqliteDB>
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  explicit SqlitePool(std::string path, std::size_t max_connections = 8);

  // Acquire a ready-to-use connection; blocks while all are in use.
  std::shared_ptr<SqliteDB> Acquire();

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string path_;
  std::size_t max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace backupmon::db::sqlite
