#include "internal/state/state_manager.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using fetchledger::db::model::DownloadStatus;
using fetchledger::db::model::PostStatus;
using fetchledger::db::model::SessionStatus;
using fetchledger::db::sqlite::SqliteTransaction;
using fetchledger::state::MetadataType;
using fetchledger::state::MetadataValue;
using fetchledger::state::StateManager;
using fetchledger::util::ParseJsonObject;

std::filesystem::path TestDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fetchledger_state_manager_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

StateManager::Options MakeOptions(const std::string& name) {
  StateManager::Options options;
  options.path                = (TestDir(name) / "state.db").string();
  options.max_connections     = 4;
  options.prewarm_connections = 1;
  return options;
}

google::protobuf::Struct Post(const std::string& id) {
  return ParseJsonObject(R"({"id": ")" + id + R"(", "title": "t"})");
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

void TestAliceScenario() {
  StateManager state(MakeOptions("alice"));
  const auto   session = state.CreateSession(ParseJsonObject(R"({"version": "1.0"})"), "user", "alice");
  assert(session.rfind("user_alice_", 0) == 0);

  state.SavePost(session, Post("p1"));
  const auto download = state.AddDownload("p1", session, "https://example.invalid/p1.jpg", "p1.jpg");
  state.MarkDownloadCompleted(download, static_cast<std::int64_t>(1024), std::string("abc123"));
  state.MarkPostProcessed("p1", PostStatus::kProcessed);

  const auto resume = state.GetResumeState(session);
  assert(!resume.can_resume);
  assert(resume.statistics.total_posts == 1);
  assert(resume.statistics.processed_posts == 1);
  assert(resume.pending_posts.empty());

  const auto downloads = state.GetDownloads(session);
  assert(downloads.size() == 1);
  assert(downloads[0].status == DownloadStatus::kCompleted);
  assert(downloads[0].file_size == 1024);
  assert(downloads[0].checksum == std::string("abc123"));
  assert(downloads[0].completed_at.has_value());

  const auto record = state.GetSession(session);
  assert(record && record->status == SessionStatus::kActive);
  assert(record->config_hash.size() == 16);
  assert(record->successful_downloads == 1);
  assert(record->start_time.has_value());

  const auto created = ParseJsonObject(record->metadata);
  assert(fetchledger::util::FindStringField(created, "created_by") == std::string("StateManager"));
  assert(fetchledger::util::FindStringField(created, "config_version") == std::string("1.0"));
}

void TestOneActiveSessionPerTarget() {
  StateManager state(MakeOptions("conflict"));
  const auto   config = ParseJsonObject(R"({"limit": 10})");
  const auto   first  = state.CreateSession(config, "user", "bob", std::string("s1"));

  assert(Throws<fetchledger::util::Conflict>([&] { state.CreateSession(config, "user", "bob", std::string("s2")); }));
  // volatile keys do not make it a different run
  assert(Throws<fetchledger::util::Conflict>(
      [&] { state.CreateSession(ParseJsonObject(R"({"limit": 10, "verbose": true})"), "user", "bob", std::string("s2")); }));
  assert(Throws<fetchledger::util::Conflict>([&] { state.CreateSession(ParseJsonObject("{}"), "user", "carol", first); }));

  // another config is another run
  state.CreateSession(ParseJsonObject(R"({"limit": 11})"), "user", "bob", std::string("s3"));

  state.UpdateSessionStatus(first, SessionStatus::kCompleted, fetchledger::util::Now());
  state.CreateSession(config, "user", "bob", std::string("s2"));

  const auto done = state.GetSession(first);
  assert(done && done->status == SessionStatus::kCompleted);
  assert(done->end_time.has_value());

  // reactivating the completed run would collide with s2
  assert(Throws<fetchledger::util::Conflict>([&] { state.UpdateSessionStatus(first, SessionStatus::kActive); }));
  assert(Throws<fetchledger::util::NotFound>([&] { state.UpdateSessionStatus("missing", SessionStatus::kPaused); }));
}

void TestGeneratedIdsAreDistinctWithinOneSecond() {
  StateManager state(MakeOptions("generated_ids"));
  const auto   config = ParseJsonObject(R"({"limit": 10})");

  const auto first = state.CreateSession(config, "user", "alice");
  state.UpdateSessionStatus(first, SessionStatus::kCompleted, fetchledger::util::Now());
  const auto second = state.CreateSession(config, "user", "alice");
  const auto other  = state.CreateSession(ParseJsonObject(R"({"limit": 20})"), "user", "alice");

  assert(first != second && second != other && first != other);
  assert(second.rfind("user_alice_", 0) == 0);
  assert(state.GetSession(second)->status == SessionStatus::kActive);
  assert(state.ListSessions().size() == 3);
}

void TestSavePostUpserts() {
  StateManager state(MakeOptions("upsert"));
  const auto   session = state.CreateSession(ParseJsonObject("{}"), "subreddit", "pics");

  state.SavePost(session, Post("p1"));
  const auto before = state.GetPosts(session);
  assert(before.size() == 1);

  state.SavePost(session, ParseJsonObject(R"({"id": "p1", "title": "renamed", "score": 5})"), PostStatus::kSkipped);
  const auto after = state.GetPosts(session);
  assert(after.size() == 1);
  assert(after[0].discovered_at == before[0].discovered_at);
  assert(after[0].status == PostStatus::kSkipped);
  assert(fetchledger::util::FindStringField(after[0].post_data, "title") == std::string("renamed"));

  const auto record = state.GetSession(session);
  assert(record->total_posts == 1);
  assert(record->processed_posts == 1);
}

void TestInvalidInputsAreRejected() {
  StateManager state(MakeOptions("invalid"));
  const auto   session = state.CreateSession(ParseJsonObject("{}"), "user", "dave");

  assert(Throws<fetchledger::util::InvalidArgument>([&] { state.SavePost(session, ParseJsonObject(R"({"title": "no id"})")); }));
  assert(Throws<fetchledger::util::InvalidArgument>([&] { state.SavePost(session, ParseJsonObject(R"({"id": ""})")); }));
  assert(Throws<fetchledger::util::NotFound>([&] { state.SavePost("missing", Post("p1")); }));
  assert(Throws<fetchledger::util::NotFound>([&] { state.MarkPostProcessed("missing", PostStatus::kProcessed); }));
  assert(Throws<fetchledger::util::InvalidArgument>([&] { state.MarkPostProcessed("missing", PostStatus::kPending); }));
  assert(Throws<fetchledger::util::NotFound>([&] { state.MarkDownloadStarted(9999); }));
  assert(Throws<fetchledger::util::NotFound>([&] { state.MarkDownloadCompleted(9999); }));
  assert(Throws<fetchledger::util::NotFound>([&] { state.MarkDownloadFailed(9999, "x"); }));
  assert(Throws<fetchledger::util::NotFound>([&] { state.GetResumeState("missing"); }));
  assert(Throws<fetchledger::util::NotFound>([&] { state.RecomputeSessionCounters("missing"); }));
  assert(Throws<fetchledger::util::ConstraintViolation>([&] { state.AddDownload("no-such-post", session, "u", "f"); }));
  assert(!state.GetSession("missing").has_value());
}

void TestProcessedCounterTracksTerminalPosts() {
  StateManager state(MakeOptions("processed"));
  const auto   session = state.CreateSession(ParseJsonObject("{}"), "user", "erin");

  for (const char* id : {"a", "b", "c", "d"}) {
    state.SavePost(session, Post(id));
  }
  state.MarkPostProcessed("a", PostStatus::kProcessed);
  state.MarkPostProcessed("b", PostStatus::kSkipped);
  state.MarkPostProcessed("c", PostStatus::kFailed, std::string("timeout"));

  const auto record = state.GetSession(session);
  assert(record->total_posts == 4);
  assert(record->processed_posts == 3);

  const auto failed = state.GetPosts(session, PostStatus::kFailed);
  assert(failed.size() == 1);
  assert(failed[0].processing_attempts == 1);
  assert(failed[0].error_message == std::string("timeout"));
  assert(failed[0].last_attempt_at.has_value());

  const auto pending = state.GetPosts(session, PostStatus::kPending);
  assert(pending.size() == 1 && pending[0].id == "d");
}

void TestResumeStateFollowsWork() {
  StateManager state(MakeOptions("resume"));
  const auto   session = state.CreateSession(ParseJsonObject("{}"), "user", "frank");
  assert(!state.GetResumeState(session).can_resume);

  state.SavePost(session, Post("p1"));
  auto resume = state.GetResumeState(session);
  assert(resume.can_resume);
  assert(resume.pending_posts.size() == 1);
  assert(resume.statistics.pending_posts == 1);

  state.MarkPostProcessed("p1", PostStatus::kProcessed);
  const auto download = state.AddDownload("p1", session, "https://example.invalid/a", "a.bin");
  state.MarkDownloadStarted(download);
  assert(state.GetDownloads(session, DownloadStatus::kDownloading).size() == 1);
  state.MarkDownloadFailed(download, "connection reset");

  resume = state.GetResumeState(session);
  assert(resume.can_resume);
  assert(resume.pending_posts.empty());
  assert(resume.failed_downloads.size() == 1);
  assert(resume.failed_downloads[0].download_attempts == 1);
  assert(resume.failed_downloads[0].error_message == std::string("connection reset"));
  assert(state.GetSession(session)->failed_downloads == 1);

  // a retry that succeeds clears the error and moves the counters
  state.MarkDownloadCompleted(download, static_cast<std::int64_t>(10));
  resume = state.GetResumeState(session);
  assert(!resume.can_resume);
  assert(!state.GetDownloads(session)[0].error_message.has_value());

  const auto record = state.GetSession(session);
  assert(record->successful_downloads == 1);
  assert(record->failed_downloads == 0);
}

void TestDownloadAttemptLimit() {
  auto options                  = MakeOptions("attempt_limit");
  options.max_download_attempts = 2;
  StateManager state(options);
  const auto   session = state.CreateSession(ParseJsonObject("{}"), "user", "gina");

  state.SavePost(session, Post("p1"), PostStatus::kProcessed);
  const auto download = state.AddDownload("p1", session, "u", "f", std::string("/tmp/f"));
  assert(state.GetDownloads(session)[0].local_path == std::string("/tmp/f"));

  state.MarkDownloadFailed(download, "first");
  assert(state.GetResumeState(session).failed_downloads.size() == 1);

  state.MarkDownloadFailed(download, "second");
  const auto resume = state.GetResumeState(session);
  assert(resume.failed_downloads.empty());
  assert(!resume.can_resume);
  assert(state.GetDownloads(session, DownloadStatus::kFailed).size() == 1);
}

void TestTypedMetadata() {
  StateManager state(MakeOptions("metadata"));
  const auto   session = state.CreateSession(ParseJsonObject("{}"), "user", "hank");

  state.SetMetadata(session, "complete", MetadataValue::Bool(true));
  state.SetMetadata(session, "count", MetadataValue::Number(12));
  state.SetMetadata(session, "label", MetadataValue::String("true"));
  state.SetMetadata(session, "extra", MetadataValue::Json(fetchledger::util::ParseJsonValue(R"({"a": [1, 2]})")));

  const auto complete = state.GetMetadata(session, "complete");
  assert(complete && complete->Type() == MetadataType::kBoolean && complete->AsBool());

  const auto label = state.GetMetadata(session, "label");
  assert(label && label->Type() == MetadataType::kString && label->AsString() == "true");

  state.SetMetadata(session, "count", MetadataValue::Number(13));
  assert(state.GetMetadata(session, "count")->AsNumber() == 13);
  assert(!state.GetMetadata(session, "absent").has_value());

  const auto all = state.GetAllMetadata(session);
  assert(all.size() == 4);
  assert(all.at("extra").Type() == MetadataType::kJson);
  assert(all.at("extra").Serialize() == R"({"a":[1,2]})");

  assert(Throws<fetchledger::util::NotFound>([&] { state.SetMetadata("missing", "k", MetadataValue::Bool(false)); }));
}

void TestListSessions() {
  StateManager state(MakeOptions("list"));
  state.CreateSession(ParseJsonObject("{}"), "user", "a", std::string("s1"));
  state.CreateSession(ParseJsonObject("{}"), "user", "b", std::string("s2"));
  state.CreateSession(ParseJsonObject("{}"), "subreddit", "c", std::string("s3"));
  state.UpdateSessionStatus("s2", SessionStatus::kPaused);

  const auto all = state.ListSessions();
  assert(all.size() == 3);
  assert(all[0].id == "s3" && all[2].id == "s1");

  fetchledger::state::SessionFilter filter;
  filter.status = SessionStatus::kPaused;
  const auto paused = state.ListSessions(filter);
  assert(paused.size() == 1 && paused[0].id == "s2");

  filter             = {};
  filter.target_type = "user";
  filter.limit       = 1;
  const auto users = state.ListSessions(filter);
  assert(users.size() == 1 && users[0].id == "s2");
}

void TestCleanupRemovesOnlyOldFinishedSessions() {
  StateManager state(MakeOptions("cleanup"));
  state.CreateSession(ParseJsonObject("{}"), "user", "old_done", std::string("old_done"));
  state.CreateSession(ParseJsonObject("{}"), "user", "old_active", std::string("old_active"));
  state.CreateSession(ParseJsonObject("{}"), "user", "new_done", std::string("new_done"));
  state.SavePost("old_done", Post("p1"));
  state.SetMetadata("old_done", "k", MetadataValue::String("v"));
  state.UpdateSessionStatus("old_done", SessionStatus::kCompleted);
  state.UpdateSessionStatus("new_done", SessionStatus::kFailed);

  state.RunMaintenance([](SqliteTransaction& tx) {
    tx.Prepare("UPDATE sessions SET created_at = '2000-01-01 00:00:00.000' WHERE id IN ('old_done', 'old_active');").Run();
  });

  const auto expired = state.FindExpiredSessions(30);
  assert(expired.size() == 1 && expired[0] == "old_done");

  assert(state.CleanupOldSessions(30) == 1);
  assert(!state.GetSession("old_done").has_value());
  assert(state.GetSession("old_active").has_value());
  assert(state.GetSession("new_done").has_value());

  // children went with the session
  assert(state.GetPosts("old_done").empty());
  assert(state.GetAllMetadata("old_done").empty());
  assert(state.CheckIntegrity().statistics.total_posts == 0);

  assert(state.CleanupOldSessions(30) == 0);
}

void TestDeleteSessionCascades() {
  StateManager state(MakeOptions("delete"));
  const auto   session = state.CreateSession(ParseJsonObject("{}"), "user", "ivy");
  state.SavePost(session, Post("p1"));
  state.AddDownload("p1", session, "u", "f");

  assert(state.DeleteSession(session));
  assert(!state.DeleteSession(session));
  assert(state.GetDownloads(session).empty());

  // a post id may be reused once its session is gone
  const auto next = state.CreateSession(ParseJsonObject("{}"), "user", "ivy");
  state.SavePost(next, Post("p1"));
  assert(state.GetPosts(next).size() == 1);
}

void TestIntegrityAndCompact() {
  StateManager state(MakeOptions("integrity"));
  const auto   session = state.CreateSession(ParseJsonObject("{}"), "user", "jack");
  state.SavePost(session, Post("p1"));
  state.SavePost(session, Post("p2"), PostStatus::kProcessed);
  const auto download = state.AddDownload("p2", session, "u", "f");
  state.MarkDownloadCompleted(download);
  state.SetMetadata(session, "k", MetadataValue::Number(1));

  auto report = state.CheckIntegrity();
  assert(report.database_ok);
  assert(report.issues.empty());
  assert(report.statistics.total_sessions == 1);
  assert(report.statistics.active_sessions == 1);
  assert(report.statistics.total_posts == 2);
  assert(report.statistics.pending_posts == 1);
  assert(report.statistics.total_downloads == 1);
  assert(report.statistics.completed_downloads == 1);
  assert(report.statistics.metadata_entries == 1);

  state.Compact();
  report = state.CheckIntegrity();
  assert(report.database_ok);
  assert(report.statistics.total_posts == 2);
}

void TestIntegrityCheckDoesNotReportExhaustionAsCorruption() {
  auto options                = MakeOptions("integrity_exhausted");
  options.max_connections     = 1;
  options.prewarm_connections = 1;
  options.acquire_timeout     = std::chrono::milliseconds(50);
  StateManager state(options);

  {
    const auto held = state.Pool()->Acquire();
    assert(Throws<fetchledger::util::ResourceExhausted>([&] { (void)state.CheckIntegrity(); }));
  }
  assert(state.CheckIntegrity().database_ok);

  state.Close();
  assert(Throws<fetchledger::util::InvalidState>([&] { (void)state.CheckIntegrity(); }));
}

void TestDataSurvivesReopen() {
  const auto options = MakeOptions("reopen");
  {
    StateManager state(options);
    state.CreateSession(ParseJsonObject("{}"), "user", "kim", std::string("s1"));
    state.SavePost("s1", Post("p1"));
  }
  StateManager state(options);
  assert(state.GetSession("s1").has_value());
  assert(state.GetPosts("s1").size() == 1);
}

void TestClosedManagerRejectsCalls() {
  StateManager state(MakeOptions("closed"));
  state.Close();
  assert(Throws<fetchledger::util::InvalidState>([&] { state.ListSessions(); }));
}

} // namespace

int main() {
  TestAliceScenario();
  TestOneActiveSessionPerTarget();
  TestGeneratedIdsAreDistinctWithinOneSecond();
  TestSavePostUpserts();
  TestInvalidInputsAreRejected();
  TestProcessedCounterTracksTerminalPosts();
  TestResumeStateFollowsWork();
  TestDownloadAttemptLimit();
  TestTypedMetadata();
  TestListSessions();
  TestCleanupRemovesOnlyOldFinishedSessions();
  TestDeleteSessionCascades();
  TestIntegrityAndCompact();
  TestIntegrityCheckDoesNotReportExhaustionAsCorruption();
  TestDataSurvivesReopen();
  TestClosedManagerRejectsCalls();

  std::cout << "fetchledger_unit_state_manager: pass\n";
  return 0;
}
