#include "internal/recovery/session_recovery.hpp"

#include <cassert>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using fetchledger::db::model::DownloadStatus;
using fetchledger::db::model::PostStatus;
using fetchledger::db::model::SessionStatus;
using fetchledger::db::sqlite::SqliteTransaction;
using fetchledger::recovery::ChecksumMismatchPolicy;
using fetchledger::recovery::SessionRecovery;
using fetchledger::state::StateManager;
using fetchledger::util::ParseJsonObject;

struct Fixture {
  explicit Fixture(const std::string& name) : dir(std::filesystem::temp_directory_path() / "fetchledger_session_recovery_tests" / name) {
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    StateManager::Options options;
    options.path                = (dir / "state.db").string();
    options.max_connections     = 3;
    options.prewarm_connections = 1;
    state                       = std::make_unique<StateManager>(options);
  }

  std::filesystem::path WriteFile(const std::string& name, const std::string& content) const {
    const auto    path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
  }

  std::filesystem::path         dir;
  std::unique_ptr<StateManager> state;
};

google::protobuf::Struct Post(const std::string& id) {
  return ParseJsonObject(R"({"id": ")" + id + R"(", "title": "t"})");
}

void Backdate(StateManager& state, const std::string& session_id, const std::string& modifier) {
  state.RunMaintenance([&](SqliteTransaction& tx) {
    tx.Prepare("UPDATE sessions SET created_at = strftime('%Y-%m-%d %H:%M:%f', 'now', ?) WHERE id = ?;")
        .Bind(1, modifier)
        .Bind(2, session_id)
        .Run();
  });
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestRepairCorrectsCounters() {
  Fixture         fx("counters");
  SessionRecovery recovery(*fx.state);
  const auto      session = fx.state->CreateSession(ParseJsonObject("{}"), "user", "alice");
  fx.state->SavePost(session, Post("p1"));
  fx.state->SavePost(session, Post("p2"), PostStatus::kSkipped);

  auto report = recovery.RepairSession(session);
  assert(report.success);
  assert(report.Healthy());

  fx.state->RunMaintenance([&](SqliteTransaction& tx) {
    tx.Prepare("UPDATE sessions SET processed_posts = 99, total_posts = 0 WHERE id = ?;").Bind(1, session).Run();
  });

  report = recovery.RepairSession(session);
  assert(report.success);
  assert(!report.Healthy());
  assert(report.issues_found.size() == 1);
  assert(report.issues_found[0].type == "counter_mismatch");
  assert(report.issues_found[0].count == 2);
  assert(report.repairs_performed.size() == 1);
  assert(report.repairs_performed[0] == "Corrected 2 session counter(s)");

  const auto record = fx.state->GetSession(session);
  assert(record->processed_posts == 1);
  assert(record->total_posts == 2);

  assert(recovery.RepairSession(session).Healthy());
}

void TestRepairMarksMissingFilesFailed() {
  Fixture         fx("missing_files");
  SessionRecovery recovery(*fx.state);
  const auto      session = fx.state->CreateSession(ParseJsonObject("{}"), "user", "bob");
  fx.state->SavePost(session, Post("p1"), PostStatus::kProcessed);
  fx.state->SavePost(session, Post("p2"), PostStatus::kProcessed);

  const auto present = fx.WriteFile("present.jpg", "data");
  const auto gone    = (fx.dir / "gone.jpg").string();
  fx.state->MarkDownloadCompleted(fx.state->AddDownload("p1", session, "u1", "present.jpg", present.string()));
  fx.state->MarkDownloadCompleted(fx.state->AddDownload("p2", session, "u2", "gone.jpg", gone));

  const auto report = recovery.RepairSession(session);
  assert(report.success);
  assert(report.issues_found.size() == 1);
  assert(report.issues_found[0].type == "missing_files");
  assert(report.issues_found[0].examples.size() == 1 && report.issues_found[0].examples[0] == gone);
  assert(report.repairs_performed[0] == "Marked 1 missing file(s) as failed");

  const auto failed = fx.state->GetDownloads(session, DownloadStatus::kFailed);
  assert(failed.size() == 1);
  assert(failed[0].error_message == "File missing during repair: " + gone);

  const auto record = fx.state->GetSession(session);
  assert(record->successful_downloads == 1);
  assert(record->failed_downloads == 1);
}

void TestRepairReportsStructuralProblems() {
  Fixture         fx("structural");
  SessionRecovery recovery(*fx.state);
  const auto      session = fx.state->CreateSession(ParseJsonObject("{}"), "user", "carol");
  fx.state->SavePost(session, Post("lonely"), PostStatus::kProcessed);

  // write a download for a post that does not exist, bypassing foreign keys
  {
    fetchledger::db::sqlite::SqliteDB raw(fx.state->DatabasePath());
    raw.Exec("PRAGMA foreign_keys=OFF;");
    raw.Prepare("INSERT INTO downloads(post_id, session_id, url) VALUES('ghost', ?, 'u');").Bind(1, session).Run();
  }

  const auto report = recovery.RepairSession(session);
  assert(report.success);

  bool saw_lonely = false;
  bool saw_ghost  = false;
  for (const auto& issue : report.issues_found) {
    if (issue.type == "posts_without_downloads") {
      saw_lonely = issue.count == 1 && issue.examples[0] == "lonely";
    }
    if (issue.type == "downloads_without_posts") {
      saw_ghost = issue.count == 1;
    }
  }
  assert(saw_lonely);
  assert(saw_ghost);

  const auto integrity = fx.state->CheckIntegrity();
  assert(integrity.database_ok);
  bool saw_fk = false;
  for (const auto& issue : integrity.issues) {
    if (issue.type == "foreign_key_violation" && issue.detail == "downloads -> posts") {
      saw_fk = true;
    }
  }
  assert(saw_fk);

  assert(Throws<fetchledger::util::NotFound>([&] { (void)recovery.RepairSession("missing"); }));
}

void TestValidateAliceScenario() {
  Fixture         fx("validate_alice");
  SessionRecovery recovery(*fx.state);
  const auto      session = fx.state->CreateSession(ParseJsonObject("{}"), "user", "alice");
  fx.state->SavePost(session, Post("p1"));

  const auto file     = fx.WriteFile("p1.jpg", std::string(1024, 'x'));
  const auto download = fx.state->AddDownload("p1", session, "https://example.invalid/p1.jpg", "p1.jpg", file.string());
  fx.state->MarkDownloadCompleted(download, static_cast<std::int64_t>(1024), std::string("abc123"));
  fx.state->MarkPostProcessed("p1", PostStatus::kProcessed);

  const auto resume = fx.state->GetResumeState(session);
  assert(!resume.can_resume);
  assert(resume.statistics.total_posts == 1);

  std::filesystem::remove(file);

  const auto report = recovery.ValidateFileIntegrity(session);
  assert(report.files_checked == 1);
  assert(report.files_missing == 1);
  assert(report.files_marked_failed == 1);
  assert(report.issues.size() == 1 && report.issues[0].type == "missing_file");

  const auto downloads = fx.state->GetDownloads(session);
  assert(downloads[0].status == DownloadStatus::kFailed);
  assert(downloads[0].error_message == std::string("File missing during integrity check"));

  // the failed download is now retryable
  assert(fx.state->GetResumeState(session).can_resume);
  assert(Throws<fetchledger::util::NotFound>([&] { (void)recovery.ValidateFileIntegrity("missing"); }));
}

void TestChecksumPolicies() {
  for (const auto policy : {ChecksumMismatchPolicy::kReport, ChecksumMismatchPolicy::kMarkFailed}) {
    Fixture                  fx(policy == ChecksumMismatchPolicy::kReport ? "checksum_report" : "checksum_mark_failed");
    SessionRecovery::Options options;
    options.checksum_policy = policy;
    SessionRecovery recovery(*fx.state, options);

    const auto session = fx.state->CreateSession(ParseJsonObject("{}"), "user", "dora");
    fx.state->SavePost(session, Post("good"), PostStatus::kProcessed);
    fx.state->SavePost(session, Post("upper"), PostStatus::kProcessed);
    fx.state->SavePost(session, Post("bad"), PostStatus::kProcessed);
    fx.state->SavePost(session, Post("nosum"), PostStatus::kProcessed);

    const auto good  = fx.WriteFile("good.bin", "hello");
    const auto upper = fx.WriteFile("upper.bin", "hello");
    const auto bad   = fx.WriteFile("bad.bin", "tampered");
    const auto nosum = fx.WriteFile("nosum.bin", "anything");

    std::string upper_sum = fetchledger::util::Sha256Hex("hello");
    for (auto& c : upper_sum) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    fx.state->MarkDownloadCompleted(fx.state->AddDownload("good", session, "u1", "good.bin", good.string()), std::nullopt,
                                    fetchledger::util::Sha256Hex("hello"));
    fx.state->MarkDownloadCompleted(fx.state->AddDownload("upper", session, "u2", "upper.bin", upper.string()), std::nullopt, upper_sum);
    const auto bad_id = fx.state->AddDownload("bad", session, "u3", "bad.bin", bad.string());
    fx.state->MarkDownloadCompleted(bad_id, std::nullopt, fetchledger::util::Sha256Hex("hello"));
    fx.state->MarkDownloadCompleted(fx.state->AddDownload("nosum", session, "u4", "nosum.bin", nosum.string()));

    const auto report = recovery.ValidateFileIntegrity(session);
    assert(report.files_checked == 4);
    assert(report.files_valid == 3);
    assert(report.files_missing == 0);
    assert(report.files_corrupted == 1);
    assert(report.issues.size() == 1 && report.issues[0].type == "checksum_mismatch");

    const auto failed = fx.state->GetDownloads(session, DownloadStatus::kFailed);
    if (policy == ChecksumMismatchPolicy::kReport) {
      assert(report.files_marked_failed == 0);
      assert(failed.empty());
    } else {
      assert(report.files_marked_failed == 1);
      assert(failed.size() == 1 && failed[0].id == bad_id);
    }
  }
}

void TestExportWritesSessionDocument() {
  Fixture         fx("export");
  SessionRecovery recovery(*fx.state);
  const auto      session = fx.state->CreateSession(ParseJsonObject(R"({"version": "2"})"), "subreddit", "pics");
  fx.state->SavePost(session, Post("p1"), PostStatus::kProcessed);
  fx.state->SavePost(session, Post("p2"));
  fx.state->MarkDownloadCompleted(fx.state->AddDownload("p1", session, "u1", "a.jpg"), static_cast<std::int64_t>(7));
  fx.state->SetMetadata(session, "complete", fetchledger::state::MetadataValue::Bool(true));
  fx.state->SetMetadata(session, "pages", fetchledger::state::MetadataValue::Number(3));

  const auto path   = fx.dir / "export.json";
  const auto report = recovery.ExportSessionData(session, path);
  assert(report.posts_exported == 2);
  assert(report.downloads_exported == 1);
  assert(report.export_path == path.string());
  assert(!std::filesystem::exists(fx.dir / "export.json.tmp"));

  std::ifstream     in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto doc = ParseJsonObject(buffer.str());

  assert(fetchledger::util::FindStringField(doc, "export_version") == std::string("1.0"));
  assert(fetchledger::util::FindField(doc, "export_timestamp") != nullptr);

  const auto& exported = fetchledger::util::FindField(doc, "session")->struct_value();
  assert(fetchledger::util::FindStringField(exported, "id") == session);
  assert(fetchledger::util::FindStringField(exported, "status") == std::string("active"));

  assert(fetchledger::util::FindField(doc, "posts")->list_value().values_size() == 2);
  const auto& downloads = fetchledger::util::FindField(doc, "downloads")->list_value();
  assert(downloads.values_size() == 1);
  assert(fetchledger::util::FindStringField(downloads.values(0).struct_value(), "status") == std::string("completed"));

  const auto& metadata = fetchledger::util::FindField(doc, "metadata")->struct_value();
  assert(fetchledger::util::FindField(metadata, "complete")->kind_case() == google::protobuf::Value::kBoolValue);
  assert(fetchledger::util::FindField(metadata, "complete")->bool_value());
  assert(fetchledger::util::FindField(metadata, "pages")->number_value() == 3);

  assert(Throws<fetchledger::util::NotFound>([&] { (void)recovery.ExportSessionData("missing", fx.dir / "x.json"); }));
  assert(Throws<fetchledger::util::IOError>([&] { (void)recovery.ExportSessionData(session, fx.dir / "no" / "such" / "dir.json"); }));
}

void TestResumeSession() {
  Fixture         fx("resume");
  SessionRecovery recovery(*fx.state);
  const auto      session = fx.state->CreateSession(ParseJsonObject("{}"), "user", "erin");

  assert(Throws<fetchledger::util::InvalidState>([&] { (void)recovery.ResumeSession(session); }));
  assert(Throws<fetchledger::util::NotFound>([&] { (void)recovery.ResumeSession("missing"); }));

  fx.state->SavePost(session, Post("p1"));
  fx.state->UpdateSessionStatus(session, SessionStatus::kPaused);

  const auto report = recovery.ResumeSession(session);
  assert(report.reactivated);
  assert(report.pending_posts == 1);
  assert(report.failed_downloads == 0);
  assert(report.statistics.total_posts == 1);
  assert(fx.state->GetSession(session)->status == SessionStatus::kActive);

  assert(!recovery.ResumeSession(session).reactivated);

  fx.state->UpdateSessionStatus(session, SessionStatus::kCompleted);
  assert(Throws<fetchledger::util::InvalidState>([&] { (void)recovery.ResumeSession(session); }));
}

void TestFindResumableSessions() {
  Fixture         fx("resumable");
  SessionRecovery recovery(*fx.state);

  fx.state->CreateSession(ParseJsonObject("{}"), "user", "older", std::string("older"));
  fx.state->CreateSession(ParseJsonObject("{}"), "user", "newer", std::string("newer"));
  fx.state->CreateSession(ParseJsonObject("{}"), "user", "stale", std::string("stale"));
  fx.state->CreateSession(ParseJsonObject("{}"), "user", "idle", std::string("idle"));
  fx.state->CreateSession(ParseJsonObject("{}"), "user", "done", std::string("done"));

  fx.state->SavePost("older", Post("a"));
  fx.state->SavePost("newer", Post("b"));
  fx.state->SavePost("stale", Post("c"));
  fx.state->SavePost("done", Post("d"));
  fx.state->UpdateSessionStatus("newer", SessionStatus::kPaused);
  fx.state->UpdateSessionStatus("done", SessionStatus::kCompleted);

  Backdate(*fx.state, "older", "-2 hours");
  Backdate(*fx.state, "newer", "-1 hours");
  Backdate(*fx.state, "stale", "-10 days");

  const auto found = recovery.FindResumableSessions();
  assert(found.size() == 2);
  assert(found[0].session.id == "newer");
  assert(found[1].session.id == "older");
  assert(found[1].age_hours > 1.5 && found[1].age_hours < 2.5);
  assert(found[0].resume_state.pending_posts.size() == 1);

  assert(recovery.FindResumableSessions(30).size() == 3);
}

void TestCleanupAbandonedSessions() {
  Fixture                  fx("cleanup");
  SessionRecovery::Options options;
  options.abandoned_max_age_days = 14;
  SessionRecovery recovery(*fx.state, options);

  for (const char* id : {"old_completed", "old_failed", "old_active", "recent_completed"}) {
    fx.state->CreateSession(ParseJsonObject("{}"), "user", id, std::string(id));
  }
  fx.state->UpdateSessionStatus("old_completed", SessionStatus::kCompleted);
  fx.state->UpdateSessionStatus("old_failed", SessionStatus::kFailed);
  fx.state->UpdateSessionStatus("recent_completed", SessionStatus::kCompleted);
  for (const char* id : {"old_completed", "old_failed", "old_active"}) {
    Backdate(*fx.state, id, "-20 days");
  }

  const auto report = recovery.CleanupAbandonedSessions();
  assert(report.sessions_removed == 2);
  assert(report.files_cleaned == 0);
  assert(report.errors.empty());
  assert(!fx.state->GetSession("old_completed").has_value());
  assert(!fx.state->GetSession("old_failed").has_value());
  assert(fx.state->GetSession("old_active").has_value());
  assert(fx.state->GetSession("recent_completed").has_value());

  assert(recovery.CleanupAbandonedSessions(30).sessions_removed == 0);
}

} // namespace

int main() {
  TestRepairCorrectsCounters();
  TestRepairMarksMissingFilesFailed();
  TestRepairReportsStructuralProblems();
  TestValidateAliceScenario();
  TestChecksumPolicies();
  TestExportWritesSessionDocument();
  TestResumeSession();
  TestFindResumableSessions();
  TestCleanupAbandonedSessions();

  std::cout << "fetchledger_unit_session_recovery: pass\n";
  return 0;
}
