#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace fetchledger::db::sqlite {

class Statement;

/*
  Per-connection settings applied by Configure().
*/
struct ConnectionOptions {
  std::chrono::milliseconds busy_timeout{30000};

  // page cache per connection, in KiB
  int cache_size_kib = 64000;

  // OFF | NORMAL | FULL | EXTRA
  std::string synchronous = "NORMAL";
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  A connection is used by one thread at a time; SqlitePool hands them out.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, ConnectionOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  Statement Prepare(std::string_view sql);

  // Rows touched by the last INSERT/UPDATE/DELETE on this connection.
  int Changes() const;

  std::int64_t LastInsertRowId() const;

  // Configure PRAGMAs (busy timeout, foreign keys, WAL, cache).
  void Configure();

 private:
  sqlite3*          db_ = nullptr;
  std::string       path_;
  ConnectionOptions options_;
};

/*
  Translate a sqlite result code into the util error hierarchy:
    BUSY/LOCKED -> util::Busy
    CONSTRAINT  -> util::ConstraintViolation
    otherwise   -> util::StorageError
*/
[[noreturn]] void ThrowSqliteError(sqlite3* db, int rc, std::string_view context);

} // namespace fetchledger::db::sqlite
