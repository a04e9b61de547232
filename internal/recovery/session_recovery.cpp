#include "session_recovery.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <system_error>

#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace fetchledger::recovery {

using db::model::DownloadRecord;
using db::model::DownloadStatus;
using db::model::PostRecord;
using db::model::SessionRecord;
using db::model::SessionStatus;
using db::sqlite::SqliteTransaction;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::int64_t kMaxResumeCandidates = 100;

// First column of every row, as text.
std::vector<std::string> QueryIds(const SqliteTransaction& tx, const char* sql, const std::string& session_id) {
  auto st = tx.Prepare(sql);
  st.Bind(1, session_id);

  std::vector<std::string> out;
  while (st.Step()) {
    out.push_back(st.Text(0));
  }
  return out;
}

bool FileExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

template <typename Fn>
void RunRepairStep(RepairReport& report, std::string_view step, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    report.success = false;
    report.errors.push_back(std::string(step) + ": " + e.what());
    FETCHLEDGER_LOG_ERROR("Repair step failed",
                          {StringField("session", report.session_id), StringField("step", step), StringField("error", e.what())});
  }
}

google::protobuf::Value OptionalString(const std::optional<std::string>& value) {
  return value ? util::MakeString(*value) : util::MakeNull();
}

google::protobuf::Value OptionalNumber(const std::optional<std::int64_t>& value) {
  return value ? util::MakeNumber(static_cast<double>(*value)) : util::MakeNull();
}

google::protobuf::Value Number(std::int64_t value) {
  return util::MakeNumber(static_cast<double>(value));
}

google::protobuf::Value SessionToJson(const SessionRecord& s) {
  google::protobuf::Struct out;
  auto&                    f = *out.mutable_fields();
  f["id"]                    = util::MakeString(s.id);
  f["created_at"]            = util::MakeString(s.created_at);
  f["updated_at"]            = util::MakeString(s.updated_at);
  f["config_hash"]           = util::MakeString(s.config_hash);
  f["target_type"]           = util::MakeString(s.target_type);
  f["target_value"]          = util::MakeString(s.target_value);
  f["status"]                = util::MakeString(db::model::ToString(s.status));
  f["total_posts"]           = Number(s.total_posts);
  f["processed_posts"]       = Number(s.processed_posts);
  f["successful_downloads"]  = Number(s.successful_downloads);
  f["failed_downloads"]      = Number(s.failed_downloads);
  f["start_time"]            = OptionalString(s.start_time);
  f["end_time"]              = OptionalString(s.end_time);

  // stored as JSON text; keep it as a string if it does not parse
  try {
    f["metadata"] = util::MakeStruct(util::ParseJsonObject(s.metadata));
  } catch (const util::InvalidArgument&) {
    f["metadata"] = util::MakeString(s.metadata);
  }
  return util::MakeStruct(std::move(out));
}

google::protobuf::Value PostToJson(const PostRecord& p) {
  google::protobuf::Struct out;
  auto&                    f = *out.mutable_fields();
  f["id"]                    = util::MakeString(p.id);
  f["session_id"]            = util::MakeString(p.session_id);
  f["discovered_at"]         = util::MakeString(p.discovered_at);
  f["post_data"]             = util::MakeStruct(p.post_data);
  f["status"]                = util::MakeString(db::model::ToString(p.status));
  f["processing_attempts"]   = Number(p.processing_attempts);
  f["last_attempt_at"]       = OptionalString(p.last_attempt_at);
  f["error_message"]         = OptionalString(p.error_message);
  return util::MakeStruct(std::move(out));
}

google::protobuf::Value DownloadToJson(const DownloadRecord& d) {
  google::protobuf::Struct out;
  auto&                    f = *out.mutable_fields();
  f["id"]                    = Number(d.id);
  f["post_id"]               = util::MakeString(d.post_id);
  f["session_id"]            = util::MakeString(d.session_id);
  f["url"]                   = util::MakeString(d.url);
  f["local_path"]            = OptionalString(d.local_path);
  f["filename"]              = OptionalString(d.filename);
  f["file_size"]             = OptionalNumber(d.file_size);
  f["status"]                = util::MakeString(db::model::ToString(d.status));
  f["download_attempts"]     = Number(d.download_attempts);
  f["started_at"]            = OptionalString(d.started_at);
  f["completed_at"]          = OptionalString(d.completed_at);
  f["error_message"]         = OptionalString(d.error_message);
  f["checksum"]              = OptionalString(d.checksum);
  return util::MakeStruct(std::move(out));
}

} // namespace

SessionRecovery::SessionRecovery(state::StateManager& state) : SessionRecovery(state, Options{}) {
}

SessionRecovery::SessionRecovery(state::StateManager& state, Options options) : state_(state), options_(options) {
}

// ------------------------------------------------------------------
// Resume
// ------------------------------------------------------------------

std::vector<ResumableSession> SessionRecovery::FindResumableSessions() {
  return FindResumableSessions(options_.resumable_max_age_days);
}

std::vector<ResumableSession> SessionRecovery::FindResumableSessions(int max_age_days) {
  const auto now    = util::Now();
  const auto cutoff = now - std::chrono::hours(24) * max_age_days;

  std::vector<SessionRecord> candidates;
  for (const auto status : {SessionStatus::kActive, SessionStatus::kPaused}) {
    state::SessionFilter filter;
    filter.status = status;
    filter.limit  = kMaxResumeCandidates;
    for (auto& session : state_.ListSessions(filter)) {
      candidates.push_back(std::move(session));
    }
  }

  std::vector<ResumableSession> out;
  for (auto& session : candidates) {
    const auto created = util::ParseTimestamp(session.created_at);
    if (!created) {
      FETCHLEDGER_LOG_WARN("Session has unreadable created_at", {StringField("session", session.id), StringField("created_at", session.created_at)});
      continue;
    }
    if (*created < cutoff) {
      continue;
    }

    try {
      auto resume = state_.GetResumeState(session.id);
      if (!resume.can_resume) {
        continue;
      }

      ResumableSession item;
      item.age_hours    = std::chrono::duration<double, std::ratio<3600>>(now - *created).count();
      item.session      = std::move(session);
      item.resume_state = std::move(resume);
      out.push_back(std::move(item));
    } catch (const std::exception& e) {
      FETCHLEDGER_LOG_WARN("Skipping session while looking for resumable work", {StringField("session", session.id), StringField("error", e.what())});
    }
  }

  std::sort(out.begin(), out.end(), [](const ResumableSession& a, const ResumableSession& b) {
    return a.session.created_at > b.session.created_at;
  });
  return out;
}

ResumeReport SessionRecovery::ResumeSession(const std::string& session_id) {
  FETCHLEDGER_LOG_INFO("Resuming session", {StringField("session", session_id)});

  const auto resume = state_.GetResumeState(session_id);
  if (db::model::IsTerminal(resume.session.status)) {
    throw util::InvalidState("Session " + session_id + " is " + std::string(db::model::ToString(resume.session.status)));
  }
  if (!resume.can_resume) {
    throw util::InvalidState("Session " + session_id + " has no pending work to resume");
  }

  ResumeReport report;
  report.session_id       = session_id;
  report.pending_posts    = static_cast<std::int64_t>(resume.pending_posts.size());
  report.failed_downloads = static_cast<std::int64_t>(resume.failed_downloads.size());
  report.statistics       = resume.statistics;

  if (resume.session.status == SessionStatus::kPaused) {
    state_.UpdateSessionStatus(session_id, SessionStatus::kActive);
    report.reactivated = true;
  }

  FETCHLEDGER_LOG_INFO("Session ready for resume",
                       {StringField("session", session_id),
                        IntField("pending_posts", report.pending_posts),
                        IntField("failed_downloads", report.failed_downloads),
                        BoolField("reactivated", report.reactivated)});
  return report;
}

// ------------------------------------------------------------------
// Repair
// ------------------------------------------------------------------

RepairReport SessionRecovery::RepairSession(const std::string& session_id) {
  FETCHLEDGER_LOG_INFO("Repairing session", {StringField("session", session_id)});

  if (!state_.GetSession(session_id)) {
    throw util::NotFound("Session " + session_id + " not found");
  }

  RepairReport report;
  report.session_id = session_id;

  // Orphans cannot exist while foreign keys are on; the file may have been
  // edited with them off.
  RunRepairStep(report, "orphaned_posts", [&] {
    std::vector<std::string> ids;
    state_.RunMaintenance([&](SqliteTransaction& tx) {
      ids = QueryIds(tx,
                     "SELECT p.id FROM posts p LEFT JOIN sessions s ON p.session_id = s.id"
                     " WHERE p.session_id = ? AND s.id IS NULL;",
                     session_id);
    });
    if (!ids.empty()) {
      report.issues_found.push_back(state::MakeIssue("orphaned_posts", "posts whose session row is missing", ids));
    }
  });

  RunRepairStep(report, "posts_without_downloads", [&] {
    std::vector<std::string> ids;
    state_.RunMaintenance([&](SqliteTransaction& tx) {
      ids = QueryIds(tx,
                     "SELECT p.id FROM posts p LEFT JOIN downloads d ON p.id = d.post_id"
                     " WHERE p.session_id = ? AND p.status = 'processed' AND d.id IS NULL;",
                     session_id);
    });
    if (!ids.empty()) {
      report.issues_found.push_back(state::MakeIssue("posts_without_downloads", "processed posts with no download record", ids));
    }
  });

  RunRepairStep(report, "downloads_without_posts", [&] {
    std::vector<std::string> ids;
    state_.RunMaintenance([&](SqliteTransaction& tx) {
      ids = QueryIds(tx,
                     "SELECT d.id FROM downloads d LEFT JOIN posts p ON d.post_id = p.id"
                     " WHERE d.session_id = ? AND p.id IS NULL;",
                     session_id);
    });
    if (!ids.empty()) {
      report.issues_found.push_back(state::MakeIssue("downloads_without_posts", "downloads whose post row is missing", ids));
    }
  });

  RunRepairStep(report, "counters", [&] {
    static const char* const kCounters[] = {"total_posts", "processed_posts", "successful_downloads", "failed_downloads"};

    std::vector<std::string> mismatched;
    state_.RunMaintenance([&](SqliteTransaction& tx) {
      std::int64_t actual[4] = {};
      {
        auto st = tx.Prepare(
            "SELECT total_posts, processed_posts, successful_downloads, failed_downloads,"
            " (SELECT COUNT(*) FROM posts WHERE session_id = ?1),"
            " (SELECT COUNT(*) FROM posts WHERE session_id = ?1 AND status IN ('processed', 'skipped', 'failed')),"
            " (SELECT COUNT(*) FROM downloads WHERE session_id = ?1 AND status = 'completed'),"
            " (SELECT COUNT(*) FROM downloads WHERE session_id = ?1 AND status = 'failed')"
            " FROM sessions WHERE id = ?1;");
        st.Bind(1, session_id);
        if (!st.Step()) {
          throw util::NotFound("Session " + session_id + " not found");
        }
        for (int i = 0; i < 4; ++i) {
          const std::int64_t cached = st.Int64(i);
          actual[i]                 = st.Int64(i + 4);
          if (cached != actual[i]) {
            mismatched.push_back(std::string(kCounters[i]) + ": cached " + std::to_string(cached) + ", actual " + std::to_string(actual[i]));
          }
        }
      }
      if (mismatched.empty()) {
        return;
      }

      tx.Prepare(
            "UPDATE sessions SET total_posts = ?, processed_posts = ?, successful_downloads = ?, failed_downloads = ?"
            " WHERE id = ?;")
          .Bind(1, actual[0])
          .Bind(2, actual[1])
          .Bind(3, actual[2])
          .Bind(4, actual[3])
          .Bind(5, session_id)
          .Run();
    });

    if (!mismatched.empty()) {
      report.issues_found.push_back(state::MakeIssue("counter_mismatch", "cached session counters differ from row counts", mismatched));
      report.repairs_performed.push_back("Corrected " + std::to_string(mismatched.size()) + " session counter(s)");
    }
  });

  RunRepairStep(report, "missing_files", [&] {
    std::vector<std::string> missing;
    state_.RunMaintenance([&](SqliteTransaction& tx) {
      std::vector<std::pair<std::int64_t, std::string>> gone;
      {
        auto st = tx.Prepare(
            "SELECT id, COALESCE(NULLIF(local_path, ''), filename) FROM downloads"
            " WHERE session_id = ? AND status = 'completed'"
            " AND COALESCE(NULLIF(local_path, ''), filename) IS NOT NULL;");
        st.Bind(1, session_id);
        while (st.Step()) {
          std::string path = st.Text(1);
          if (!path.empty() && !FileExists(path)) {
            gone.emplace_back(st.Int64(0), std::move(path));
          }
        }
      }

      for (const auto& [id, path] : gone) {
        tx.Prepare(
              "UPDATE downloads SET status = 'failed', download_attempts = download_attempts + 1, error_message = ?"
              " WHERE id = ?;")
            .Bind(1, "File missing during repair: " + path)
            .Bind(2, id)
            .Run();
        missing.push_back(path);
      }
    });

    if (!missing.empty()) {
      report.issues_found.push_back(state::MakeIssue("missing_files", "completed downloads whose file is gone", missing));
      report.repairs_performed.push_back("Marked " + std::to_string(missing.size()) + " missing file(s) as failed");
    }
  });

  RunRepairStep(report, "touch", [&] {
    state_.RunMaintenance([&](SqliteTransaction& tx) {
      tx.Prepare("UPDATE sessions SET updated_at = strftime('%Y-%m-%d %H:%M:%f', 'now') WHERE id = ?;").Bind(1, session_id).Run();
    });
  });

  FETCHLEDGER_LOG_INFO("Repair finished",
                       {StringField("session", session_id),
                        IntField("issues", static_cast<std::int64_t>(report.issues_found.size())),
                        IntField("repairs", static_cast<std::int64_t>(report.repairs_performed.size())),
                        IntField("errors", static_cast<std::int64_t>(report.errors.size()))});
  return report;
}

// ------------------------------------------------------------------
// Cleanup
// ------------------------------------------------------------------

CleanupReport SessionRecovery::CleanupAbandonedSessions() {
  return CleanupAbandonedSessions(options_.abandoned_max_age_days);
}

CleanupReport SessionRecovery::CleanupAbandonedSessions(int max_age_days) {
  FETCHLEDGER_LOG_INFO("Cleaning up abandoned sessions", {IntField("max_age_days", max_age_days)});

  CleanupReport report;

  std::vector<std::string> expired;
  try {
    expired = state_.FindExpiredSessions(max_age_days);
  } catch (const std::exception& e) {
    report.errors.push_back(e.what());
    FETCHLEDGER_LOG_ERROR("Cleanup failed", {StringField("error", e.what())});
    return report;
  }

  for (const auto& session_id : expired) {
    try {
      if (state_.DeleteSession(session_id)) {
        ++report.sessions_removed;
      }
    } catch (const std::exception& e) {
      report.errors.push_back("Session " + session_id + ": " + e.what());
      FETCHLEDGER_LOG_ERROR("Failed to remove session", {StringField("session", session_id), StringField("error", e.what())});
    }
  }

  return report;
}

// ------------------------------------------------------------------
// File integrity
// ------------------------------------------------------------------

FileIntegrityReport SessionRecovery::ValidateFileIntegrity(const std::string& session_id) {
  FETCHLEDGER_LOG_INFO("Validating file integrity", {StringField("session", session_id)});

  if (!state_.GetSession(session_id)) {
    throw util::NotFound("Session " + session_id + " not found");
  }

  FileIntegrityReport      report;
  std::vector<std::string> missing;
  std::vector<std::string> corrupted;
  std::vector<std::string> unreadable;

  for (const auto& download : state_.GetDownloads(session_id, DownloadStatus::kCompleted)) {
    const auto path = download.ResolvedPath();
    if (!path) {
      continue;
    }
    ++report.files_checked;

    if (!FileExists(*path)) {
      ++report.files_missing;
      missing.push_back(*path);
      state_.MarkDownloadFailed(download.id, "File missing during integrity check");
      ++report.files_marked_failed;
      continue;
    }

    if (!download.checksum || download.checksum->empty()) {
      ++report.files_valid;
      continue;
    }

    std::string actual;
    try {
      actual = util::Sha256File(*path);
    } catch (const util::IOError& e) {
      unreadable.push_back(*path + ": " + e.what());
      continue;
    }

    if (actual == Lower(*download.checksum)) {
      ++report.files_valid;
      continue;
    }

    ++report.files_corrupted;
    corrupted.push_back(*path + " (expected " + *download.checksum + ", got " + actual + ")");
    if (options_.checksum_policy == ChecksumMismatchPolicy::kMarkFailed) {
      state_.MarkDownloadFailed(download.id, "Checksum mismatch during integrity check: expected " + *download.checksum + ", got " + actual);
      ++report.files_marked_failed;
    }
  }

  if (!missing.empty()) {
    report.issues.push_back(state::MakeIssue("missing_file", "marked failed", missing));
  }
  if (!corrupted.empty()) {
    report.issues.push_back(state::MakeIssue(
        "checksum_mismatch", options_.checksum_policy == ChecksumMismatchPolicy::kMarkFailed ? "marked failed" : "reported only", corrupted));
  }
  if (!unreadable.empty()) {
    report.issues.push_back(state::MakeIssue("checksum_error", "could not read file", unreadable));
  }

  FETCHLEDGER_LOG_INFO("File integrity checked",
                       {StringField("session", session_id),
                        IntField("checked", report.files_checked),
                        IntField("missing", report.files_missing),
                        IntField("corrupted", report.files_corrupted)});
  return report;
}

// ------------------------------------------------------------------
// Export
// ------------------------------------------------------------------

ExportReport SessionRecovery::ExportSessionData(const std::string& session_id, const std::filesystem::path& export_path) {
  FETCHLEDGER_LOG_INFO("Exporting session", {StringField("session", session_id), StringField("path", export_path.string())});

  const auto session = state_.GetSession(session_id);
  if (!session) {
    throw util::NotFound("Session " + session_id + " not found");
  }

  const auto posts     = state_.GetPosts(session_id);
  const auto downloads = state_.GetDownloads(session_id);
  const auto metadata  = state_.GetAllMetadata(session_id);

  google::protobuf::Struct doc;
  auto&                    f = *doc.mutable_fields();
  f["export_timestamp"]      = util::MakeString(util::FormatTimestamp(util::Now()));
  f["export_version"]        = util::MakeString("1.0");
  f["session"]               = SessionToJson(*session);

  auto* post_list = f["posts"].mutable_list_value();
  for (const auto& post : posts) {
    *post_list->add_values() = PostToJson(post);
  }

  auto* download_list = f["downloads"].mutable_list_value();
  for (const auto& download : downloads) {
    *download_list->add_values() = DownloadToJson(download);
  }

  auto* meta = f["metadata"].mutable_struct_value();
  for (const auto& [key, value] : metadata) {
    (*meta->mutable_fields())[key] = value.ToJsonValue();
  }

  std::filesystem::path tmp = export_path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::IOError("cannot open " + tmp.string() + " for writing");
    }
    out << util::ToJson(doc, true);
    out.close();
    if (!out) {
      throw util::IOError("failed writing " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, export_path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tmp, ec);
    throw util::IOError("cannot move export into place at " + export_path.string() + ": " + reason);
  }

  ExportReport report;
  report.export_path        = export_path.string();
  report.posts_exported     = static_cast<std::int64_t>(posts.size());
  report.downloads_exported = static_cast<std::int64_t>(downloads.size());
  return report;
}

} // namespace fetchledger::recovery
