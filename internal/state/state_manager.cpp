#include "state_manager.hpp"

#include <map>
#include <system_error>
#include <type_traits>
#include <utility>

#include "internal/db/sqlite/schema.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/state/config_fingerprint.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace fetchledger::state {

using db::model::DownloadRecord;
using db::model::DownloadStatus;
using db::model::PostRecord;
using db::model::PostStatus;
using db::model::SessionRecord;
using db::model::SessionStatus;
using db::sqlite::SqliteTransaction;
using db::sqlite::Statement;
using db::sqlite::TransactionMode;

namespace {

constexpr const char* kSessionColumns =
    "id, created_at, updated_at, config_hash, target_type, target_value, status,"
    " total_posts, processed_posts, successful_downloads, failed_downloads,"
    " start_time, end_time, metadata";

constexpr const char* kPostColumns =
    "id, session_id, discovered_at, post_data, status, processing_attempts, last_attempt_at, error_message";

constexpr const char* kDownloadColumns =
    "id, post_id, session_id, url, local_path, filename, file_size, status, download_attempts,"
    " started_at, completed_at, error_message, checksum";

// Posts in these states count as processed.
constexpr const char* kTerminalPostStatuses = "('processed', 'skipped', 'failed')";

SessionRecord ReadSession(const Statement& st) {
  SessionRecord r;
  r.id           = st.Text(0);
  r.created_at   = st.Text(1);
  r.updated_at   = st.Text(2);
  r.config_hash  = st.Text(3);
  r.target_type  = st.Text(4);
  r.target_value = st.Text(5);

  const auto status = db::model::ParseSessionStatus(st.Text(6));
  if (!status) {
    throw util::StorageError("session " + r.id + " has unknown status '" + st.Text(6) + "'");
  }
  r.status = *status;

  r.total_posts          = st.Int64(7);
  r.processed_posts      = st.Int64(8);
  r.successful_downloads = st.Int64(9);
  r.failed_downloads     = st.Int64(10);
  r.start_time           = st.OptionalText(11);
  r.end_time             = st.OptionalText(12);
  r.metadata             = st.OptionalText(13).value_or("{}");
  return r;
}

PostRecord ReadPost(const Statement& st) {
  PostRecord r;
  r.id            = st.Text(0);
  r.session_id    = st.Text(1);
  r.discovered_at = st.Text(2);

  try {
    r.post_data = util::ParseJsonObject(st.Text(3));
  } catch (const util::InvalidArgument& e) {
    throw util::StorageError("post " + r.id + " has unreadable post_data: " + e.what());
  }

  const auto status = db::model::ParsePostStatus(st.Text(4));
  if (!status) {
    throw util::StorageError("post " + r.id + " has unknown status '" + st.Text(4) + "'");
  }
  r.status = *status;

  r.processing_attempts = st.Int64(5);
  r.last_attempt_at     = st.OptionalText(6);
  r.error_message       = st.OptionalText(7);
  return r;
}

DownloadRecord ReadDownload(const Statement& st) {
  DownloadRecord r;
  r.id         = st.Int64(0);
  r.post_id    = st.Text(1);
  r.session_id = st.Text(2);
  r.url        = st.Text(3);
  r.local_path = st.OptionalText(4);
  r.filename   = st.OptionalText(5);
  r.file_size  = st.OptionalInt64(6);

  const auto status = db::model::ParseDownloadStatus(st.Text(7));
  if (!status) {
    throw util::StorageError("download " + std::to_string(r.id) + " has unknown status '" + st.Text(7) + "'");
  }
  r.status = *status;

  r.download_attempts = st.Int64(8);
  r.started_at        = st.OptionalText(9);
  r.completed_at      = st.OptionalText(10);
  r.error_message     = st.OptionalText(11);
  r.checksum          = st.OptionalText(12);
  return r;
}

std::optional<SessionRecord> FindSession(const SqliteTransaction& tx, const std::string& session_id) {
  auto st = tx.Prepare(std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE id = ?;");
  st.Bind(1, session_id);
  if (!st.Step()) {
    return std::nullopt;
  }
  return ReadSession(st);
}

SessionRecord RequireSession(const SqliteTransaction& tx, const std::string& session_id) {
  auto session = FindSession(tx, session_id);
  if (!session) {
    throw util::NotFound("Session " + session_id + " not found");
  }
  return std::move(*session);
}

std::vector<PostRecord> SelectPosts(const SqliteTransaction& tx, const std::string& session_id, std::optional<PostStatus> status) {
  std::string sql = std::string("SELECT ") + kPostColumns + " FROM posts WHERE session_id = ?";
  if (status) {
    sql += " AND status = ?";
  }
  sql += " ORDER BY discovered_at, rowid;";

  auto st = tx.Prepare(sql);
  st.Bind(1, session_id);
  if (status) {
    st.Bind(2, db::model::ToString(*status));
  }

  std::vector<PostRecord> out;
  while (st.Step()) {
    out.push_back(ReadPost(st));
  }
  return out;
}

std::vector<DownloadRecord> SelectDownloads(const SqliteTransaction&     tx,
                                            const std::string&           session_id,
                                            std::optional<DownloadStatus> status) {
  std::string sql = std::string("SELECT ") + kDownloadColumns + " FROM downloads WHERE session_id = ?";
  if (status) {
    sql += " AND status = ?";
  }
  sql += " ORDER BY started_at, id;";

  auto st = tx.Prepare(sql);
  st.Bind(1, session_id);
  if (status) {
    st.Bind(2, db::model::ToString(*status));
  }

  std::vector<DownloadRecord> out;
  while (st.Step()) {
    out.push_back(ReadDownload(st));
  }
  return out;
}

void RefreshProcessedCount(const SqliteTransaction& tx, const std::string& session_id) {
  tx.Prepare(std::string("UPDATE sessions SET processed_posts = ("
                         "SELECT COUNT(*) FROM posts WHERE session_id = ?1 AND status IN ") +
             kTerminalPostStatuses + ") WHERE id = ?1;")
      .Bind(1, session_id)
      .Run();
}

std::string NowText() {
  return util::FormatTimestamp(util::Now());
}

std::int64_t CountOf(const SqliteTransaction& tx, const char* sql) {
  auto st = tx.Prepare(sql);
  return st.Step() ? st.Int64(0) : 0;
}

} // namespace

std::filesystem::path DefaultDatabasePath() {
  return std::filesystem::current_path() / ".fetchledger" / "state.db";
}

template <typename Fn>
auto StateManager::Transact(std::string_view operation, TransactionMode mode, Fn&& fn) {
  auto&      metrics = observability::Metrics::Instance();
  const auto started = std::chrono::steady_clock::now();
  const auto finish  = [&](bool success) {
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
    metrics.RecordOperation(operation, success);
    metrics.ObserveOperationLatencyMs(operation, elapsed.count());
  };

  try {
    SqliteTransaction tx(pool_->Acquire(), mode);
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&, SqliteTransaction&>>) {
      fn(tx);
      tx.Commit();
      finish(true);
    } else {
      auto result = fn(tx);
      tx.Commit();
      finish(true);
      return result;
    }
  } catch (...) {
    finish(false);
    throw;
  }
}

StateManager::StateManager() : StateManager(Options{}) {
}

StateManager::StateManager(Options options) : options_(std::move(options)) {
  if (options_.path.empty()) {
    options_.path = DefaultDatabasePath().string();
  }

  const auto parent = std::filesystem::path(options_.path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::IOError("cannot create database directory " + parent.string() + ": " + ec.message());
    }
  }

  db::sqlite::PoolOptions pool_options;
  pool_options.path                = options_.path;
  pool_options.max_connections     = options_.max_connections;
  pool_options.prewarm_connections = options_.prewarm_connections;
  pool_options.acquire_timeout     = options_.acquire_timeout;
  pool_options.connection          = options_.connection;

  pool_ = std::make_shared<db::sqlite::SqlitePool>(std::move(pool_options));

  {
    auto conn = pool_->Acquire();
    db::sqlite::ApplySchema(*conn);
  }

  FETCHLEDGER_LOG_INFO("State store opened",
                       {observability::StringField("db", options_.path),
                        observability::IntField("max_connections", static_cast<std::int64_t>(options_.max_connections))});
}

StateManager::~StateManager() {
  Close();
}

void StateManager::Close() {
  if (pool_) {
    pool_->CloseAll();
  }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

std::string StateManager::CreateSession(const google::protobuf::Struct& config,
                                        const std::string&              target_type,
                                        const std::string&              target_value,
                                        std::optional<std::string>      session_id) {
  const auto        now = util::Now();
  const std::string id =
      session_id ? *session_id : target_type + "_" + target_value + "_" + util::FormatCompact(now) + "_" + util::RandomTag();
  const std::string fingerprint = ConfigFingerprint(config);

  google::protobuf::Struct metadata;
  (*metadata.mutable_fields())["created_by"] = util::MakeString("StateManager");
  const auto* version                        = util::FindField(config, "version");
  (*metadata.mutable_fields())["config_version"] = version ? *version : util::MakeNull();

  Transact("create_session", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    auto active = tx.Prepare(
        "SELECT id FROM sessions"
        " WHERE config_hash = ? AND target_type = ? AND target_value = ? AND status = 'active';");
    active.Bind(1, fingerprint).Bind(2, target_type).Bind(3, target_value);
    if (active.Step()) {
      throw util::Conflict("Active session " + active.Text(0) + " already exists for " + target_type + " '" + target_value + "'");
    }

    auto existing = tx.Prepare("SELECT 1 FROM sessions WHERE id = ?;");
    existing.Bind(1, id);
    if (existing.Step()) {
      throw util::Conflict("Session " + id + " already exists");
    }

    tx.Prepare(
          "INSERT INTO sessions(id, config_hash, target_type, target_value, status, start_time, metadata)"
          " VALUES(?, ?, ?, ?, 'active', ?, ?);")
        .Bind(1, id)
        .Bind(2, fingerprint)
        .Bind(3, target_type)
        .Bind(4, target_value)
        .Bind(5, util::FormatTimestamp(now))
        .Bind(6, util::CanonicalJson(metadata))
        .Run();
  });

  FETCHLEDGER_LOG_INFO("Created session",
                       {observability::StringField("session", id),
                        observability::StringField("target_type", target_type),
                        observability::StringField("target", target_value),
                        observability::StringField("config_hash", fingerprint)});
  return id;
}

std::optional<SessionRecord> StateManager::GetSession(const std::string& session_id) {
  return Transact("get_session", TransactionMode::kRead, [&](SqliteTransaction& tx) { return FindSession(tx, session_id); });
}

void StateManager::UpdateSessionStatus(const std::string& session_id, SessionStatus status, std::optional<util::TimePoint> end_time) {
  Transact("update_session_status", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    try {
      if (end_time) {
        tx.Prepare("UPDATE sessions SET status = ?, end_time = ? WHERE id = ?;")
            .Bind(1, db::model::ToString(status))
            .Bind(2, util::FormatTimestamp(*end_time))
            .Bind(3, session_id)
            .Run();
      } else {
        tx.Prepare("UPDATE sessions SET status = ? WHERE id = ?;").Bind(1, db::model::ToString(status)).Bind(2, session_id).Run();
      }
    } catch (const util::ConstraintViolation& e) {
      throw util::Conflict("Cannot mark session " + session_id + " " + std::string(db::model::ToString(status)) + ": " + e.what());
    }

    if (tx.Connection().Changes() == 0) {
      throw util::NotFound("Session " + session_id + " not found");
    }
  });
}

std::vector<SessionRecord> StateManager::ListSessions(const SessionFilter& filter) {
  return Transact("list_sessions", TransactionMode::kRead, [&](SqliteTransaction& tx) {
    std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE 1 = 1";
    if (filter.status) {
      sql += " AND status = ?";
    }
    if (filter.target_type) {
      sql += " AND target_type = ?";
    }
    sql += " ORDER BY created_at DESC, rowid DESC LIMIT ?;";

    auto st  = tx.Prepare(sql);
    int  idx = 1;
    if (filter.status) {
      st.Bind(idx++, db::model::ToString(*filter.status));
    }
    if (filter.target_type) {
      st.Bind(idx++, *filter.target_type);
    }
    st.Bind(idx, static_cast<std::int64_t>(filter.limit));

    std::vector<SessionRecord> out;
    while (st.Step()) {
      out.push_back(ReadSession(st));
    }
    return out;
  });
}

int StateManager::CleanupOldSessions(int days_old) {
  const int removed = Transact("cleanup_old_sessions", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    tx.Prepare(
          "DELETE FROM sessions WHERE status IN ('completed', 'failed')"
          " AND created_at < strftime('%Y-%m-%d %H:%M:%f', 'now', ?);")
        .Bind(1, "-" + std::to_string(days_old) + " days")
        .Run();
    return tx.Connection().Changes();
  });

  if (removed > 0) {
    FETCHLEDGER_LOG_INFO("Removed old sessions", {observability::IntField("count", removed), observability::IntField("days_old", days_old)});
  }
  return removed;
}

std::vector<std::string> StateManager::FindExpiredSessions(int days_old) {
  return Transact("find_expired_sessions", TransactionMode::kRead, [&](SqliteTransaction& tx) {
    auto st = tx.Prepare(
        "SELECT id FROM sessions WHERE status IN ('completed', 'failed')"
        " AND created_at < strftime('%Y-%m-%d %H:%M:%f', 'now', ?) ORDER BY created_at;");
    st.Bind(1, "-" + std::to_string(days_old) + " days");

    std::vector<std::string> out;
    while (st.Step()) {
      out.push_back(st.Text(0));
    }
    return out;
  });
}

bool StateManager::DeleteSession(const std::string& session_id) {
  return Transact("delete_session", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    tx.Prepare("DELETE FROM sessions WHERE id = ?;").Bind(1, session_id).Run();
    return tx.Connection().Changes() > 0;
  });
}

void StateManager::RecomputeSessionCounters(const std::string& session_id) {
  Transact("recompute_session_counters", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    tx.Prepare(std::string("UPDATE sessions SET"
                           " total_posts = (SELECT COUNT(*) FROM posts WHERE session_id = ?1),"
                           " processed_posts = (SELECT COUNT(*) FROM posts WHERE session_id = ?1 AND status IN ") +
               kTerminalPostStatuses +
               "),"
               " successful_downloads = (SELECT COUNT(*) FROM downloads WHERE session_id = ?1 AND status = 'completed'),"
               " failed_downloads = (SELECT COUNT(*) FROM downloads WHERE session_id = ?1 AND status = 'failed')"
               " WHERE id = ?1;")
        .Bind(1, session_id)
        .Run();

    if (tx.Connection().Changes() == 0) {
      throw util::NotFound("Session " + session_id + " not found");
    }
  });
}

// ------------------------------------------------------------------
// Posts
// ------------------------------------------------------------------

void StateManager::SavePost(const std::string& session_id, const google::protobuf::Struct& post_data, PostStatus status) {
  const auto post_id = util::FindStringField(post_data, "id");
  if (!post_id || post_id->empty()) {
    throw util::InvalidArgument("Post data must include a non-empty 'id' field");
  }
  const std::string payload = util::ToJson(post_data);

  Transact("save_post", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    RequireSession(tx, session_id);

    tx.Prepare(
          "INSERT INTO posts(id, session_id, post_data, status) VALUES(?, ?, ?, ?)"
          " ON CONFLICT(id) DO UPDATE SET"
          " session_id = excluded.session_id, post_data = excluded.post_data, status = excluded.status;")
        .Bind(1, *post_id)
        .Bind(2, session_id)
        .Bind(3, payload)
        .Bind(4, db::model::ToString(status))
        .Run();

    RefreshProcessedCount(tx, session_id);
  });
}

void StateManager::MarkPostProcessed(const std::string& post_id, PostStatus status, std::optional<std::string> error_message) {
  if (!db::model::IsTerminal(status)) {
    throw util::InvalidArgument("Post " + post_id + " cannot be marked pending");
  }
  Transact("mark_post_processed", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    tx.Prepare(
          "UPDATE posts SET status = ?, processing_attempts = processing_attempts + 1,"
          " last_attempt_at = ?, error_message = ? WHERE id = ?;")
        .Bind(1, db::model::ToString(status))
        .Bind(2, NowText())
        .Bind(3, error_message)
        .Bind(4, post_id)
        .Run();

    if (tx.Connection().Changes() == 0) {
      throw util::NotFound("Post " + post_id + " not found");
    }

    auto owner = tx.Prepare("SELECT session_id FROM posts WHERE id = ?;");
    owner.Bind(1, post_id);
    if (owner.Step()) {
      RefreshProcessedCount(tx, owner.Text(0));
    }
  });
}

std::vector<PostRecord> StateManager::GetPosts(const std::string& session_id, std::optional<PostStatus> status) {
  return Transact("get_posts", TransactionMode::kRead, [&](SqliteTransaction& tx) { return SelectPosts(tx, session_id, status); });
}

// ------------------------------------------------------------------
// Downloads
// ------------------------------------------------------------------

std::int64_t StateManager::AddDownload(const std::string&         post_id,
                                       const std::string&         session_id,
                                       const std::string&         url,
                                       const std::string&         filename,
                                       std::optional<std::string> local_path) {
  return Transact("add_download", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    try {
      tx.Prepare(
            "INSERT INTO downloads(post_id, session_id, url, filename, local_path, status, started_at)"
            " VALUES(?, ?, ?, ?, ?, 'pending', ?);")
          .Bind(1, post_id)
          .Bind(2, session_id)
          .Bind(3, url)
          .Bind(4, filename)
          .Bind(5, local_path)
          .Bind(6, NowText())
          .Run();
    } catch (const util::ConstraintViolation& e) {
      throw util::ConstraintViolation("download for post " + post_id + " in session " + session_id + " rejected: " + e.what());
    }
    return tx.Connection().LastInsertRowId();
  });
}

void StateManager::MarkDownloadStarted(std::int64_t download_id) {
  Transact("mark_download_started", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    tx.Prepare("UPDATE downloads SET status = 'downloading', started_at = ? WHERE id = ?;").Bind(1, NowText()).Bind(2, download_id).Run();
    if (tx.Connection().Changes() == 0) {
      throw util::NotFound("Download " + std::to_string(download_id) + " not found");
    }
  });
}

void StateManager::MarkDownloadCompleted(std::int64_t download_id, std::optional<std::int64_t> file_size, std::optional<std::string> checksum) {
  Transact("mark_download_completed", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    tx.Prepare(
          "UPDATE downloads SET status = 'completed', completed_at = ?, file_size = ?, checksum = ?,"
          " error_message = NULL WHERE id = ?;")
        .Bind(1, NowText())
        .Bind(2, file_size)
        .Bind(3, checksum)
        .Bind(4, download_id)
        .Run();
    if (tx.Connection().Changes() == 0) {
      throw util::NotFound("Download " + std::to_string(download_id) + " not found");
    }
  });
}

void StateManager::MarkDownloadFailed(std::int64_t download_id, const std::string& error_message) {
  Transact("mark_download_failed", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    tx.Prepare(
          "UPDATE downloads SET status = 'failed', download_attempts = download_attempts + 1,"
          " error_message = ? WHERE id = ?;")
        .Bind(1, error_message)
        .Bind(2, download_id)
        .Run();
    if (tx.Connection().Changes() == 0) {
      throw util::NotFound("Download " + std::to_string(download_id) + " not found");
    }
  });
}

std::vector<DownloadRecord> StateManager::GetDownloads(const std::string& session_id, std::optional<DownloadStatus> status) {
  return Transact("get_downloads", TransactionMode::kRead, [&](SqliteTransaction& tx) { return SelectDownloads(tx, session_id, status); });
}

// ------------------------------------------------------------------
// Resume
// ------------------------------------------------------------------

ResumeState StateManager::GetResumeState(const std::string& session_id) {
  return Transact("get_resume_state", TransactionMode::kRead, [&](SqliteTransaction& tx) {
    ResumeState state;
    state.session       = RequireSession(tx, session_id);
    state.pending_posts = SelectPosts(tx, session_id, PostStatus::kPending);

    for (auto& download : SelectDownloads(tx, session_id, DownloadStatus::kFailed)) {
      if (options_.max_download_attempts > 0 && download.download_attempts >= options_.max_download_attempts) {
        continue;
      }
      state.failed_downloads.push_back(std::move(download));
    }

    auto st = tx.Prepare(
        "SELECT COUNT(*),"
        " COUNT(CASE WHEN status = 'pending' THEN 1 END),"
        " COUNT(CASE WHEN status = 'processed' THEN 1 END),"
        " COUNT(CASE WHEN status = 'skipped' THEN 1 END),"
        " COUNT(CASE WHEN status = 'failed' THEN 1 END)"
        " FROM posts WHERE session_id = ?;");
    st.Bind(1, session_id);
    if (st.Step()) {
      state.statistics.total_posts     = st.Int64(0);
      state.statistics.pending_posts   = st.Int64(1);
      state.statistics.processed_posts = st.Int64(2);
      state.statistics.skipped_posts   = st.Int64(3);
      state.statistics.failed_posts    = st.Int64(4);
    }

    state.can_resume = !state.pending_posts.empty() || !state.failed_downloads.empty();
    return state;
  });
}

// ------------------------------------------------------------------
// Metadata
// ------------------------------------------------------------------

void StateManager::SetMetadata(const std::string& session_id, const std::string& key, const MetadataValue& value) {
  Transact("set_metadata", TransactionMode::kWrite, [&](SqliteTransaction& tx) {
    RequireSession(tx, session_id);
    tx.Prepare(
          "INSERT INTO metadata(session_id, key, value, type) VALUES(?, ?, ?, ?)"
          " ON CONFLICT(session_id, key) DO UPDATE SET value = excluded.value, type = excluded.type;")
        .Bind(1, session_id)
        .Bind(2, key)
        .Bind(3, value.Serialize())
        .Bind(4, ToString(value.Type()))
        .Run();
  });
}

namespace {

MetadataValue ReadMetadataValue(const Statement& st, int value_col, int type_col, const std::string& key) {
  const auto type = ParseMetadataType(st.Text(type_col));
  if (!type) {
    throw util::StorageError("metadata '" + key + "' has unknown type '" + st.Text(type_col) + "'");
  }
  try {
    return MetadataValue::Deserialize(*type, st.Text(value_col));
  } catch (const util::InvalidArgument& e) {
    throw util::StorageError("metadata '" + key + "' is unreadable: " + e.what());
  }
}

} // namespace

std::optional<MetadataValue> StateManager::GetMetadata(const std::string& session_id, const std::string& key) {
  return Transact("get_metadata", TransactionMode::kRead, [&](SqliteTransaction& tx) -> std::optional<MetadataValue> {
    auto st = tx.Prepare("SELECT value, type FROM metadata WHERE session_id = ? AND key = ?;");
    st.Bind(1, session_id).Bind(2, key);
    if (!st.Step()) {
      return std::nullopt;
    }
    return ReadMetadataValue(st, 0, 1, key);
  });
}

std::map<std::string, MetadataValue> StateManager::GetAllMetadata(const std::string& session_id) {
  return Transact("get_all_metadata", TransactionMode::kRead, [&](SqliteTransaction& tx) {
    auto st = tx.Prepare("SELECT key, value, type FROM metadata WHERE session_id = ? ORDER BY key;");
    st.Bind(1, session_id);

    std::map<std::string, MetadataValue> out;
    while (st.Step()) {
      std::string key = st.Text(0);
      auto        val = ReadMetadataValue(st, 1, 2, key);
      out.emplace(std::move(key), std::move(val));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

IntegrityReport StateManager::CheckIntegrity() {
  IntegrityReport report;

  try {
    Transact("check_integrity", TransactionMode::kRead, [&](SqliteTransaction& tx) {
      std::vector<std::string> problems;
      auto                     integrity = tx.Prepare("PRAGMA integrity_check;");
      while (integrity.Step()) {
        const std::string row = integrity.Text(0);
        if (row != "ok") {
          problems.push_back(row);
        }
      }
      if (!problems.empty()) {
        report.database_ok = false;
        report.issues.push_back(MakeIssue("integrity_check_failed", "PRAGMA integrity_check", problems));
      }

      // (table, parent) -> offending rowids
      std::map<std::pair<std::string, std::string>, std::vector<std::string>> violations;
      auto                                                                    fk = tx.Prepare("PRAGMA foreign_key_check;");
      while (fk.Step()) {
        const auto rowid = fk.OptionalInt64(1);
        violations[{fk.Text(0), fk.Text(2)}].push_back(rowid ? std::to_string(*rowid) : "?");
      }
      for (const auto& [tables, rows] : violations) {
        report.issues.push_back(MakeIssue("foreign_key_violation", tables.first + " -> " + tables.second, rows));
      }

      auto& s = report.statistics;
      auto  sessions = tx.Prepare(
          "SELECT COUNT(*),"
          " COUNT(CASE WHEN status = 'active' THEN 1 END),"
          " COUNT(CASE WHEN status = 'paused' THEN 1 END),"
          " COUNT(CASE WHEN status = 'completed' THEN 1 END),"
          " COUNT(CASE WHEN status = 'failed' THEN 1 END)"
          " FROM sessions;");
      if (sessions.Step()) {
        s.total_sessions     = sessions.Int64(0);
        s.active_sessions    = sessions.Int64(1);
        s.paused_sessions    = sessions.Int64(2);
        s.completed_sessions = sessions.Int64(3);
        s.failed_sessions    = sessions.Int64(4);
      }

      auto posts = tx.Prepare("SELECT COUNT(*), COUNT(CASE WHEN status = 'pending' THEN 1 END) FROM posts;");
      if (posts.Step()) {
        s.total_posts   = posts.Int64(0);
        s.pending_posts = posts.Int64(1);
      }

      auto downloads = tx.Prepare(
          "SELECT COUNT(*),"
          " COUNT(CASE WHEN status = 'completed' THEN 1 END),"
          " COUNT(CASE WHEN status = 'failed' THEN 1 END)"
          " FROM downloads;");
      if (downloads.Step()) {
        s.total_downloads     = downloads.Int64(0);
        s.completed_downloads = downloads.Int64(1);
        s.failed_downloads    = downloads.Int64(2);
      }

      s.metadata_entries = CountOf(tx, "SELECT COUNT(*) FROM metadata;");
    });
  } catch (const util::Busy&) {
    throw;
  } catch (const util::StorageError& e) {
    // a pool timeout or a closed manager is not corruption and propagates
    report.database_ok = false;
    report.issues.push_back(MakeIssue("integrity_check_error", e.what(), {}));
    FETCHLEDGER_LOG_ERROR("Integrity check failed", {observability::StringField("db", options_.path), observability::StringField("error", e.what())});
  }

  return report;
}

void StateManager::Compact() {
  auto&      metrics = observability::Metrics::Instance();
  const auto started = std::chrono::steady_clock::now();

  try {
    // VACUUM cannot run inside a transaction
    auto conn = pool_->Acquire();
    conn->Exec("VACUUM;");
    conn->Exec("PRAGMA wal_checkpoint(TRUNCATE);");
  } catch (...) {
    metrics.RecordOperation("compact", false);
    throw;
  }

  const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
  metrics.RecordOperation("compact", true);
  metrics.ObserveOperationLatencyMs("compact", elapsed.count());
  FETCHLEDGER_LOG_INFO("Compacted state store", {observability::StringField("db", options_.path)});
}

void StateManager::RunMaintenance(const std::function<void(SqliteTransaction&)>& fn) {
  Transact("maintenance", TransactionMode::kWrite, [&](SqliteTransaction& tx) { fn(tx); });
}

} // namespace fetchledger::state
