#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/db/model/session_record.hpp"
#include "internal/state/report.hpp"
#include "internal/state/state_manager.hpp"

namespace fetchledger::recovery {

// What ValidateFileIntegrity does with a file whose sha256 no longer
// matches the recorded checksum.
enum class ChecksumMismatchPolicy {
  kReport,
  kMarkFailed,
};

struct ResumableSession {
  db::model::SessionRecord session;
  state::ResumeState       resume_state;
  double                   age_hours = 0;
};

struct ResumeReport {
  std::string             session_id;
  std::int64_t            pending_posts    = 0;
  std::int64_t            failed_downloads = 0;
  state::ResumeStatistics statistics;
  // true when the session was paused and is active again
  bool reactivated = false;
};

struct RepairReport {
  std::string                session_id;
  bool                       success = true;
  std::vector<state::Issue>  issues_found;
  std::vector<std::string>   repairs_performed;
  std::vector<std::string>   errors;

  bool Healthy() const {
    return issues_found.empty() && errors.empty();
  }
};

struct CleanupReport {
  std::int64_t             sessions_removed = 0;
  // files on disk are never removed
  std::int64_t             files_cleaned = 0;
  std::vector<std::string> errors;
};

struct FileIntegrityReport {
  std::int64_t              files_checked       = 0;
  std::int64_t              files_valid         = 0;
  std::int64_t              files_missing       = 0;
  std::int64_t              files_corrupted     = 0;
  std::int64_t              files_marked_failed = 0;
  std::vector<state::Issue> issues;
};

struct ExportReport {
  std::string  export_path;
  std::int64_t posts_exported     = 0;
  std::int64_t downloads_exported = 0;
};

/*
  SessionRecovery

  Operator workflows on top of StateManager: find and resume interrupted
  sessions, repair inconsistent ones, verify downloaded files, export a
  session, purge old ones.

  Reads and writes go through StateManager; targeted repair SQL runs via
  StateManager::RunMaintenance. Nothing here deletes posts or downloads
  directly; only whole sessions are removed (and only terminal ones).
*/
class SessionRecovery {
 public:
  struct Options {
    ChecksumMismatchPolicy checksum_policy        = ChecksumMismatchPolicy::kReport;
    int                    resumable_max_age_days = 7;
    int                    abandoned_max_age_days = 30;
  };

  explicit SessionRecovery(state::StateManager& state);
  SessionRecovery(state::StateManager& state, Options options);

  // Active/paused sessions inside the window with work left, newest first.
  std::vector<ResumableSession> FindResumableSessions();
  std::vector<ResumableSession> FindResumableSessions(int max_age_days);

  // Throws util::NotFound / util::InvalidState (nothing to resume).
  ResumeReport ResumeSession(const std::string& session_id);

  // Throws util::NotFound; every other failure lands in the report.
  RepairReport RepairSession(const std::string& session_id);

  CleanupReport CleanupAbandonedSessions();
  CleanupReport CleanupAbandonedSessions(int max_age_days);

  FileIntegrityReport ValidateFileIntegrity(const std::string& session_id);

  // Pretty JSON document; written to <path>.tmp and renamed into place.
  ExportReport ExportSessionData(const std::string& session_id, const std::filesystem::path& export_path);

 private:
  state::StateManager& state_;
  Options              options_;
};

} // namespace fetchledger::recovery
