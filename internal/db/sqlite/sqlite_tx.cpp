#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace fetchledger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> conn, TransactionMode mode) : conn_(std::move(conn)) {
  conn_->Exec(mode == TransactionMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  // sqlite may already have rolled back on its own (e.g. SQLITE_FULL)
  if (sqlite3_get_autocommit(conn_->Handle())) {
    return;
  }
  try {
    conn_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    FETCHLEDGER_LOG_WARN("Rollback failed", {observability::StringField("db", conn_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  conn_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (!sqlite3_get_autocommit(conn_->Handle())) {
    conn_->Exec("ROLLBACK;");
  }
  finished_ = true;
}

} // namespace fetchledger::db::sqlite
