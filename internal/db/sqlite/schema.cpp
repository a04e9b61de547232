#include "schema.hpp"

#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"

namespace fetchledger::db::sqlite {

namespace {

const std::vector<SchemaMigration> kMigrations = {
    {1,
     {
         "CREATE TABLE IF NOT EXISTS sessions ("
         " id TEXT PRIMARY KEY,"
         " created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),"
         " updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),"
         " config_hash TEXT NOT NULL,"
         " target_type TEXT NOT NULL,"
         " target_value TEXT NOT NULL,"
         " status TEXT NOT NULL DEFAULT 'active' CHECK (status IN ('active', 'paused', 'completed', 'failed')),"
         " total_posts INTEGER NOT NULL DEFAULT 0,"
         " processed_posts INTEGER NOT NULL DEFAULT 0,"
         " successful_downloads INTEGER NOT NULL DEFAULT 0,"
         " failed_downloads INTEGER NOT NULL DEFAULT 0,"
         " start_time TEXT,"
         " end_time TEXT,"
         " metadata TEXT);",

         "CREATE TABLE IF NOT EXISTS posts ("
         " id TEXT PRIMARY KEY,"
         " session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,"
         " discovered_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),"
         " post_data TEXT NOT NULL,"
         " status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending', 'processed', 'skipped', 'failed')),"
         " processing_attempts INTEGER NOT NULL DEFAULT 0,"
         " last_attempt_at TEXT,"
         " error_message TEXT);",

         "CREATE TABLE IF NOT EXISTS downloads ("
         " id INTEGER PRIMARY KEY AUTOINCREMENT,"
         " post_id TEXT NOT NULL REFERENCES posts(id) ON DELETE CASCADE,"
         " session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,"
         " url TEXT NOT NULL,"
         " local_path TEXT,"
         " filename TEXT,"
         " file_size INTEGER,"
         " status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending', 'downloading', 'completed', 'failed')),"
         " download_attempts INTEGER NOT NULL DEFAULT 0,"
         " started_at TEXT,"
         " completed_at TEXT,"
         " error_message TEXT,"
         " checksum TEXT);",

         "CREATE TABLE IF NOT EXISTS metadata ("
         " id INTEGER PRIMARY KEY AUTOINCREMENT,"
         " session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,"
         " key TEXT NOT NULL,"
         " value TEXT,"
         " type TEXT NOT NULL DEFAULT 'string' CHECK (type IN ('string', 'number', 'boolean', 'json')),"
         " created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')),"
         " UNIQUE(session_id, key));",

         // at most one active session per fingerprint/target
         "CREATE UNIQUE INDEX IF NOT EXISTS idx_sessions_active_target"
         " ON sessions(config_hash, target_type, target_value) WHERE status = 'active';",

         "CREATE INDEX IF NOT EXISTS idx_sessions_status ON sessions(status);",
         "CREATE INDEX IF NOT EXISTS idx_sessions_target ON sessions(target_type, target_value);",
         "CREATE INDEX IF NOT EXISTS idx_sessions_created_at ON sessions(created_at);",
         "CREATE INDEX IF NOT EXISTS idx_posts_session_id ON posts(session_id);",
         "CREATE INDEX IF NOT EXISTS idx_posts_status ON posts(status);",
         "CREATE INDEX IF NOT EXISTS idx_posts_discovered_at ON posts(discovered_at);",
         "CREATE INDEX IF NOT EXISTS idx_downloads_post_id ON downloads(post_id);",
         "CREATE INDEX IF NOT EXISTS idx_downloads_session_id ON downloads(session_id);",
         "CREATE INDEX IF NOT EXISTS idx_downloads_status ON downloads(status);",
         "CREATE INDEX IF NOT EXISTS idx_downloads_url ON downloads(url);",
         "CREATE INDEX IF NOT EXISTS idx_metadata_session_id ON metadata(session_id);",

         "CREATE TRIGGER IF NOT EXISTS update_sessions_timestamp"
         " AFTER UPDATE ON sessions"
         " BEGIN"
         "  UPDATE sessions SET updated_at = (strftime('%Y-%m-%d %H:%M:%f', 'now')) WHERE id = NEW.id;"
         " END;",

         "CREATE TRIGGER IF NOT EXISTS update_session_post_count"
         " AFTER INSERT ON posts"
         " BEGIN"
         "  UPDATE sessions SET total_posts = (SELECT COUNT(*) FROM posts WHERE session_id = NEW.session_id)"
         "  WHERE id = NEW.session_id;"
         " END;",

         // an upsert may move a post to another session
         "CREATE TRIGGER IF NOT EXISTS update_session_post_count_on_move"
         " AFTER UPDATE OF session_id ON posts"
         " WHEN OLD.session_id <> NEW.session_id"
         " BEGIN"
         "  UPDATE sessions SET total_posts = (SELECT COUNT(*) FROM posts WHERE session_id = sessions.id)"
         "  WHERE id IN (OLD.session_id, NEW.session_id);"
         " END;",

         "CREATE TRIGGER IF NOT EXISTS update_session_download_count"
         " AFTER UPDATE OF status ON downloads"
         " WHEN OLD.status <> NEW.status"
         " BEGIN"
         "  UPDATE sessions SET"
         "   successful_downloads = (SELECT COUNT(*) FROM downloads WHERE session_id = NEW.session_id AND status = 'completed'),"
         "   failed_downloads = (SELECT COUNT(*) FROM downloads WHERE session_id = NEW.session_id AND status = 'failed')"
         "  WHERE id = NEW.session_id;"
         " END;",
     }},
};

void EnsureMigrationsTable(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS schema_migrations ("
      " version INTEGER PRIMARY KEY,"
      " applied_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f', 'now')));");
}

int ReadVersion(SqliteDB& db) {
  auto st = db.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
  return st.Step() ? static_cast<int>(st.Int64(0)) : 0;
}

} // namespace

const std::vector<SchemaMigration>& Migrations() {
  return kMigrations;
}

int LatestSchemaVersion() {
  return kMigrations.empty() ? 0 : kMigrations.back().version;
}

int CurrentSchemaVersion(SqliteDB& db) {
  auto exists = db.Prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'schema_migrations';");
  if (!exists.Step()) {
    return 0;
  }
  return ReadVersion(db);
}

void ApplySchema(SqliteDB& db) {
  if (CurrentSchemaVersion(db) >= LatestSchemaVersion()) {
    return;
  }

  // SqliteTransaction needs a shared_ptr; this one does not own the connection
  std::shared_ptr<SqliteDB> unowned(&db, [](SqliteDB*) {});
  SqliteTransaction         tx(unowned, TransactionMode::kWrite);

  EnsureMigrationsTable(db);
  const int current = ReadVersion(db);

  for (const auto& migration : kMigrations) {
    if (migration.version <= current) {
      continue;
    }
    for (const auto& sql : migration.statements) {
      db.Exec(sql);
    }
    db.Prepare("INSERT INTO schema_migrations(version) VALUES(?);").Bind(1, static_cast<std::int64_t>(migration.version)).Run();

    FETCHLEDGER_LOG_INFO("Applied schema migration",
                         {observability::StringField("db", db.Path()), observability::IntField("version", migration.version)});
  }

  tx.Commit();
}

} // namespace fetchledger::db::sqlite
