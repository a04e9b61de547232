#include "sqlite_db.hpp"

#include <algorithm>
#include <cctype>

#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/util/errors.hpp"

namespace fetchledger::db::sqlite {

void ThrowSqliteError(sqlite3* db, int rc, std::string_view context) {
  std::string message(context);
  message += ": ";
  message += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      throw util::Busy(message);
    case SQLITE_CONSTRAINT:
      throw util::ConstraintViolation(message);
    default:
      throw util::StorageError(message);
  }
}

static std::string NormalizeSynchronous(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (value == "OFF" || value == "NORMAL" || value == "FULL" || value == "EXTRA") {
    return value;
  }
  throw util::InvalidArgument("unsupported synchronous mode: " + value);
}

SqliteDB::SqliteDB(std::string path, ConnectionOptions options) : path_(std::move(path)), options_(std::move(options)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("cannot open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    ThrowSqliteError(nullptr, rc, msg);
  }
}

Statement SqliteDB::Prepare(std::string_view sql) {
  return Statement(db_, sql);
}

int SqliteDB::Changes() const {
  return sqlite3_changes(db_);
}

std::int64_t SqliteDB::LastInsertRowId() const {
  return sqlite3_last_insert_rowid(db_);
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately; set first so the
  // pragmas below already honour it
  int rc = sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count()));
  if (rc != SQLITE_OK) ThrowSqliteError(db_, rc, "busy_timeout");

  // foreign keys are OFF by default in sqlite; cascades depend on them
  Exec("PRAGMA foreign_keys=ON;");

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=" + NormalizeSynchronous(options_.synchronous) + ";");
  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-" + std::to_string(std::max(options_.cache_size_kib, 0)) + ";"); // negative means KiB
}

} // namespace fetchledger::db::sqlite
