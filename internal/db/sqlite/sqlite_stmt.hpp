#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fetchledger::db::sqlite {

/*
  RAII prepared statement.

  Bind indexes are 1-based (sqlite convention), column indexes 0-based.
  Step() returns true while rows are available and false once the
  statement is done; any other result code throws (see ThrowSqliteError).
*/
class Statement {
 public:
  Statement(sqlite3* db, std::string_view sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  Statement& Bind(int index, std::string_view value);
  Statement& Bind(int index, const std::string& value);
  Statement& Bind(int index, const char* value);
  Statement& Bind(int index, std::int64_t value);
  Statement& Bind(int index, const std::optional<std::string>& value);
  Statement& Bind(int index, const std::optional<std::int64_t>& value);
  Statement& BindNull(int index);

  bool Step();

  // Step a statement that must not return rows.
  void Run();

  bool IsNull(int col) const;
  std::string Text(int col) const;
  std::optional<std::string> OptionalText(int col) const;
  std::int64_t Int64(int col) const;
  std::optional<std::int64_t> OptionalInt64(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace fetchledger::db::sqlite
