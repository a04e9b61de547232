#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace fetchledger::db::sqlite {

struct PoolOptions {
  std::string path;

  std::size_t max_connections     = 10;
  std::size_t prewarm_connections = 3;

  // Upper bound on how long Acquire() waits once the pool is exhausted.
  std::chrono::milliseconds acquire_timeout{5000};

  ConnectionOptions connection;
};

/*
  SqlitePool

  Bounded pool of connections to one database file.

  Design notes:
  -------------
  - Each transaction gets its own connection; connections are never shared
    between threads while checked out.
  - Every connection is configured on creation (WAL, foreign keys, cache).
  - At most max_connections are open at any time. When all are checked out
    Acquire() waits up to acquire_timeout and then throws
    util::ResourceExhausted, which callers may retry.
  - No lock is held while a connection is in use; the mutex only guards the
    idle queue and the live counter.

  Lifetime:
    Must be owned by a shared_ptr (Acquire uses shared_from_this).
    Acquire returns shared_ptr<SqliteDB> whose deleter hands the connection
    back; if the pool is already gone the connection is simply closed.
*/
class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  explicit SqlitePool(PoolOptions options);
  ~SqlitePool();

  SqlitePool(const SqlitePool&)            = delete;
  SqlitePool& operator=(const SqlitePool&) = delete;

  std::shared_ptr<SqliteDB> Acquire();
  std::shared_ptr<SqliteDB> Acquire(std::chrono::milliseconds timeout);

  // Close every idle connection and refuse further acquisitions. Connections
  // still checked out are closed when they come back.
  void CloseAll();

  std::size_t LiveConnections() const;
  std::size_t IdleConnections() const;

  std::size_t MaxConnections() const {
    return options_.max_connections;
  }

  const std::string& Path() const {
    return options_.path;
  }

 private:
  std::unique_ptr<SqliteDB> CreateConnection() const;
  std::shared_ptr<SqliteDB> Wrap(std::unique_ptr<SqliteDB> conn);
  void                      Release(SqliteDB* conn);

  PoolOptions options_;

  mutable std::mutex                    mutex_;
  std::condition_variable               cv_;
  std::deque<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                           live_connections_ = 0;
  bool                                  closed_           = false;
};

} // namespace fetchledger::db::sqlite
