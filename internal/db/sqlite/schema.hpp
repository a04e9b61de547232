#pragma once

#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace fetchledger::db::sqlite {

/*
  Declarative schema for the state store.

  Tables: sessions (root), posts, downloads, metadata, schema_migrations.
  posts/downloads/metadata cascade from sessions, so deleting a session row
  is the only way their rows disappear.
*/

struct SchemaMigration {
  int                      version;
  std::vector<std::string> statements;
};

// Ordered migrations; the last entry's version is the current schema.
const std::vector<SchemaMigration>& Migrations();

int LatestSchemaVersion();

// 0 when the database has never been initialized.
int CurrentSchemaVersion(SqliteDB& db);

// Apply every migration newer than CurrentSchemaVersion() inside one
// BEGIN IMMEDIATE transaction. Safe to call concurrently from several
// processes: the version is re-read after the write lock is taken.
void ApplySchema(SqliteDB& db);

} // namespace fetchledger::db::sqlite
