#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"

namespace fetchledger::db::sqlite {

enum class TransactionMode {
  // BEGIN (deferred): snapshot reads, upgrades to a write lock on first write
  kRead,
  // BEGIN IMMEDIATE: grabs the write lock early, avoids deadlock-y upgrades
  kWrite,
};

/*
  SQLite transaction wrapper over one pooled connection.

  Semantics:
  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if neither Commit() nor Rollback() succeeded
  - The connection goes back to the pool when the transaction is destroyed
*/
class SqliteTransaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> conn, TransactionMode mode);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return conn_->Handle();
  }

  SqliteDB& Connection() const {
    return *conn_;
  }

  Statement Prepare(std::string_view sql) const {
    return conn_->Prepare(sql);
  }

  void Commit();
  void Rollback();

 private:
  std::shared_ptr<SqliteDB> conn_;
  bool                      finished_ = false;
};

} // namespace fetchledger::db::sqlite
