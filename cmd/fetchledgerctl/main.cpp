#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

using fetchledger::db::model::SessionRecord;
using fetchledger::state::Issue;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fetchledgerctl [--config <file.yaml>] [--db <path>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  check                          integrity check + statistics\n"
            << "  repair <session_id>            detect and fix inconsistencies\n"
            << "  compress                       VACUUM + WAL checkpoint\n"
            << "  stats                          store statistics\n"
            << "  sessions [status] [limit]      list sessions, newest first\n"
            << "  resumable [max_age_days]       sessions with work left\n"
            << "  resume <session_id>            reactivate a session\n"
            << "  validate <session_id>          verify downloaded files\n"
            << "  export <session_id> <file>     write session as JSON\n"
            << "  cleanup [max_age_days]         remove old completed/failed sessions\n"
            << "  migrate [dir ...]              import legacy JSON session files\n";
}

static int ParseInt(const std::string& value, const char* what) {
  const std::string message = std::string("invalid ") + what + ": '" + value + "'";

  std::size_t pos = 0;
  int         out = 0;
  try {
    out = std::stoi(value, &pos);
  } catch (const std::exception&) {
    throw fetchledger::util::InvalidArgument(message);
  }
  if (pos != value.size() || out < 0) {
    throw fetchledger::util::InvalidArgument(message);
  }
  return out;
}

static void PrintIssues(const std::vector<Issue>& issues) {
  for (const auto& issue : issues) {
    std::cout << "  " << issue.type << "  count=" << issue.count;
    if (!issue.detail.empty()) {
      std::cout << "  (" << issue.detail << ")";
    }
    std::cout << "\n";
    for (const auto& example : issue.examples) {
      std::cout << "      " << example << "\n";
    }
  }
}

static void PrintSession(const SessionRecord& s) {
  std::cout << s.id << "  " << fetchledger::db::model::ToString(s.status) << "  " << s.target_type << ":" << s.target_value
            << "  created=" << s.created_at << "  posts=" << s.processed_posts << "/" << s.total_posts
            << "  downloads ok=" << s.successful_downloads << " failed=" << s.failed_downloads << "\n";
}

static int RunCommand(fetchledger::factory::Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  auto& state    = *app.state;
  auto& recovery = *app.recovery;

  // ------------------------------------------------------------

  if (cmd == "check" || cmd == "stats") {
    const auto  report = state.CheckIntegrity();
    const auto& s      = report.statistics;

    if (cmd == "check") {
      std::cout << "database: " << (report.database_ok ? "ok" : "CORRUPT") << "\n";
      if (!report.issues.empty()) {
        std::cout << "issues:\n";
        PrintIssues(report.issues);
      }
    }

    std::cout << "sessions:  " << s.total_sessions << " (active=" << s.active_sessions << " paused=" << s.paused_sessions
              << " completed=" << s.completed_sessions << " failed=" << s.failed_sessions << ")\n"
              << "posts:     " << s.total_posts << " (pending=" << s.pending_posts << ")\n"
              << "downloads: " << s.total_downloads << " (completed=" << s.completed_downloads << " failed=" << s.failed_downloads
              << ")\n"
              << "metadata:  " << s.metadata_entries << "\n";

    if (cmd == "check" && (!report.database_ok || !report.issues.empty())) {
      return 3;
    }
    return 0;
  }

  if (cmd == "repair") {
    if (args.size() != 1) {
      Usage();
      return 1;
    }
    const auto report = recovery.RepairSession(args[0]);
    if (report.Healthy()) {
      std::cout << "session " << report.session_id << " is healthy\n";
      return 0;
    }
    if (!report.issues_found.empty()) {
      std::cout << "issues:\n";
      PrintIssues(report.issues_found);
    }
    for (const auto& repair : report.repairs_performed) {
      std::cout << "repaired: " << repair << "\n";
    }
    for (const auto& error : report.errors) {
      std::cerr << "error: " << error << "\n";
    }
    return report.success ? 0 : 2;
  }

  if (cmd == "compress") {
    state.Compact();
    std::cout << "compacted " << state.DatabasePath() << "\n";
    return 0;
  }

  if (cmd == "sessions") {
    fetchledger::state::SessionFilter filter;
    if (!args.empty()) {
      filter.status = fetchledger::db::model::ParseSessionStatus(args[0]);
      if (!filter.status) {
        std::cerr << "unknown session status: " << args[0] << "\n";
        return 1;
      }
    }
    if (args.size() >= 2) {
      filter.limit = static_cast<std::size_t>(ParseInt(args[1], "limit"));
    }
    for (const auto& session : state.ListSessions(filter)) {
      PrintSession(session);
    }
    return 0;
  }

  if (cmd == "resumable") {
    const auto sessions = args.empty() ? recovery.FindResumableSessions() : recovery.FindResumableSessions(ParseInt(args[0], "max_age_days"));
    for (const auto& item : sessions) {
      std::cout << item.session.id << "  age=" << static_cast<long long>(item.age_hours) << "h"
                << "  pending_posts=" << item.resume_state.pending_posts.size()
                << "  failed_downloads=" << item.resume_state.failed_downloads.size() << "\n";
    }
    if (sessions.empty()) {
      std::cout << "no resumable sessions\n";
    }
    return 0;
  }

  if (cmd == "resume") {
    if (args.size() != 1) {
      Usage();
      return 1;
    }
    const auto report = recovery.ResumeSession(args[0]);
    std::cout << "session " << report.session_id << (report.reactivated ? " reactivated" : " ready") << ": "
              << report.pending_posts << " pending posts, " << report.failed_downloads << " failed downloads\n";
    return 0;
  }

  if (cmd == "validate") {
    if (args.size() != 1) {
      Usage();
      return 1;
    }
    const auto report = recovery.ValidateFileIntegrity(args[0]);
    std::cout << "checked=" << report.files_checked << " valid=" << report.files_valid << " missing=" << report.files_missing
              << " corrupted=" << report.files_corrupted << " marked_failed=" << report.files_marked_failed << "\n";
    PrintIssues(report.issues);
    return report.issues.empty() ? 0 : 3;
  }

  if (cmd == "export") {
    if (args.size() != 2) {
      Usage();
      return 1;
    }
    const auto report = recovery.ExportSessionData(args[0], args[1]);
    std::cout << "exported " << report.posts_exported << " posts, " << report.downloads_exported << " downloads to "
              << report.export_path << "\n";
    return 0;
  }

  if (cmd == "cleanup") {
    const auto report = args.empty() ? recovery.CleanupAbandonedSessions()
                                     : recovery.CleanupAbandonedSessions(ParseInt(args[0], "max_age_days"));
    std::cout << "removed " << report.sessions_removed << " sessions\n";
    for (const auto& error : report.errors) {
      std::cerr << "error: " << error << "\n";
    }
    return report.errors.empty() ? 0 : 2;
  }

  if (cmd == "migrate") {
    auto options = app.migration;
    if (!args.empty()) {
      options.search_dirs.assign(args.begin(), args.end());
    }
    const auto report = fetchledger::migration::MigrateLegacySessions(options, state);
    std::cout << "status=" << fetchledger::migration::ToString(report.status) << " found=" << report.files_found
              << " migrated=" << report.files_migrated << "\n";
    for (const auto& id : report.migrated_sessions) {
      std::cout << "  " << id << "\n";
    }
    for (const auto& error : report.errors) {
      std::cerr << "error: " << error << "\n";
    }
    return report.errors.empty() ? 0 : 2;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> db_path;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--db" && i + 1 < argc) {
      db_path = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else {
      break;
    }
  }

  if (i >= argc) {
    Usage();
    return 1;
  }

  const std::string        cmd = argv[i];
  std::vector<std::string> args(argv + i + 1, argv + argc);

  try {
    auto config = config_path ? fetchledger::config::ConfigLoader::LoadFromYaml(*config_path) : fetchledger::runtime::config::RuntimeConfig{};
    if (db_path) {
      config.mutable_database()->set_path(*db_path);
    }

    fetchledger::observability::InitializeLogging(config);
    fetchledger::observability::InitializeMetrics(config);

    auto app = fetchledger::factory::Build(config);
    int  rc  = RunCommand(app, cmd, args);

    app.state->Close();
    fetchledger::observability::ShutdownMetrics();
    fetchledger::observability::ShutdownLogging();
    return rc;
  } catch (const fetchledger::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    fetchledger::observability::ShutdownMetrics();
    fetchledger::observability::ShutdownLogging();
    return 3;
  } catch (const std::exception& e) {
    FETCHLEDGER_LOG_ERROR("Command failed", {fetchledger::observability::StringField("command", cmd), fetchledger::observability::StringField("error", e.what())});
    fetchledger::observability::ShutdownMetrics();
    fetchledger::observability::ShutdownLogging();
    return 2;
  }
}
