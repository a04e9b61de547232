#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/download_record.hpp"
#include "internal/db/model/post_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/status.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/state/metadata_value.hpp"
#include "internal/state/report.hpp"
#include "internal/util/time.hpp"

namespace fetchledger::state {

// <cwd>/.fetchledger/state.db
std::filesystem::path DefaultDatabasePath();

struct SessionFilter {
  std::optional<db::model::SessionStatus> status;
  std::optional<std::string>              target_type;
  std::size_t                             limit = 50;
};

struct ResumeStatistics {
  std::int64_t total_posts     = 0;
  std::int64_t pending_posts   = 0;
  std::int64_t processed_posts = 0;
  std::int64_t skipped_posts   = 0;
  std::int64_t failed_posts    = 0;
};

struct ResumeState {
  db::model::SessionRecord               session;
  std::vector<db::model::PostRecord>     pending_posts;
  std::vector<db::model::DownloadRecord> failed_downloads;
  ResumeStatistics                       statistics;
  bool                                   can_resume = false;
};

struct IntegrityStatistics {
  std::int64_t total_sessions     = 0;
  std::int64_t active_sessions    = 0;
  std::int64_t paused_sessions    = 0;
  std::int64_t completed_sessions = 0;
  std::int64_t failed_sessions    = 0;

  std::int64_t total_posts   = 0;
  std::int64_t pending_posts = 0;

  std::int64_t total_downloads     = 0;
  std::int64_t completed_downloads = 0;
  std::int64_t failed_downloads    = 0;

  std::int64_t metadata_entries = 0;
};

struct IntegrityReport {
  bool                database_ok = true;
  std::vector<Issue>  issues;
  IntegrityStatistics statistics;
};

/*
  StateManager

  Durable record of scraping sessions, the posts they discovered, the
  downloads attempted for those posts, and per-session metadata.

  Every public method:
    - checks a connection out of the pool
    - runs in exactly one transaction (BEGIN IMMEDIATE for writes)
    - commits on success, rolls back on any exception
    - returns the connection on both paths

  Thread-safe: concurrent callers each get their own connection; SQLite
  (WAL + busy_timeout) serializes writers.
*/
class StateManager {
 public:
  struct Options {
    // empty -> DefaultDatabasePath()
    std::string path;

    std::size_t               max_connections     = 10;
    std::size_t               prewarm_connections = 3;
    std::chrono::milliseconds acquire_timeout{5000};

    db::sqlite::ConnectionOptions connection;

    // Failed downloads with this many attempts are no longer offered for
    // retry. 0 = no limit.
    std::int64_t max_download_attempts = 0;
  };

  StateManager();
  explicit StateManager(Options options);
  ~StateManager();

  StateManager(const StateManager&)            = delete;
  StateManager& operator=(const StateManager&) = delete;

  // ------------------------------------------------------------------
  // Sessions
  // ------------------------------------------------------------------

  // Returns the session id. Throws util::Conflict if an active session
  // already exists for the same config fingerprint and target.
  std::string CreateSession(const google::protobuf::Struct& config,
                            const std::string&              target_type,
                            const std::string&              target_value,
                            std::optional<std::string>      session_id = std::nullopt);

  std::optional<db::model::SessionRecord> GetSession(const std::string& session_id);

  void UpdateSessionStatus(const std::string&              session_id,
                           db::model::SessionStatus        status,
                           std::optional<util::TimePoint> end_time = std::nullopt);

  // Newest first.
  std::vector<db::model::SessionRecord> ListSessions(const SessionFilter& filter = {});

  // Deletes completed/failed sessions created more than days_old days ago.
  // Returns the number of sessions removed; children go with them.
  int CleanupOldSessions(int days_old = 30);

  // Ids of completed/failed sessions created more than days_old days ago,
  // oldest first.
  std::vector<std::string> FindExpiredSessions(int days_old);

  bool DeleteSession(const std::string& session_id);

  // Rebuild the cached counters of a session from its posts/downloads.
  void RecomputeSessionCounters(const std::string& session_id);

  // ------------------------------------------------------------------
  // Posts
  // ------------------------------------------------------------------

  // Upsert by post_data["id"].
  void SavePost(const std::string&              session_id,
                const google::protobuf::Struct& post_data,
                db::model::PostStatus           status = db::model::PostStatus::kPending);

  void MarkPostProcessed(const std::string&         post_id,
                         db::model::PostStatus      status,
                         std::optional<std::string> error_message = std::nullopt);

  // Ordered by discovery time.
  std::vector<db::model::PostRecord> GetPosts(const std::string&                   session_id,
                                              std::optional<db::model::PostStatus> status = std::nullopt);

  // ------------------------------------------------------------------
  // Downloads
  // ------------------------------------------------------------------

  std::int64_t AddDownload(const std::string&         post_id,
                           const std::string&         session_id,
                           const std::string&         url,
                           const std::string&         filename,
                           std::optional<std::string> local_path = std::nullopt);

  void MarkDownloadStarted(std::int64_t download_id);
  void MarkDownloadCompleted(std::int64_t               download_id,
                             std::optional<std::int64_t> file_size = std::nullopt,
                             std::optional<std::string>  checksum  = std::nullopt);
  void MarkDownloadFailed(std::int64_t download_id, const std::string& error_message);

  // Ordered by start time.
  std::vector<db::model::DownloadRecord> GetDownloads(const std::string&                       session_id,
                                                      std::optional<db::model::DownloadStatus> status = std::nullopt);

  // ------------------------------------------------------------------
  // Resume / metadata
  // ------------------------------------------------------------------

  ResumeState GetResumeState(const std::string& session_id);

  void SetMetadata(const std::string& session_id, const std::string& key, const MetadataValue& value);
  std::optional<MetadataValue> GetMetadata(const std::string& session_id, const std::string& key);
  std::map<std::string, MetadataValue> GetAllMetadata(const std::string& session_id);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------

  // Read-only. Reports problems instead of throwing.
  IntegrityReport CheckIntegrity();

  // VACUUM + WAL checkpoint.
  void Compact();

  // Run fn inside one write transaction. Commits if fn returns normally.
  void RunMaintenance(const std::function<void(db::sqlite::SqliteTransaction&)>& fn);

  void Close();

  const std::string& DatabasePath() const {
    return options_.path;
  }

  const std::shared_ptr<db::sqlite::SqlitePool>& Pool() const {
    return pool_;
  }

 private:
  template <typename Fn>
  auto Transact(std::string_view operation, db::sqlite::TransactionMode mode, Fn&& fn);

  Options                                 options_;
  std::shared_ptr<db::sqlite::SqlitePool> pool_;
};

} // namespace fetchledger::state
