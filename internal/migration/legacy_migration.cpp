#include "legacy_migration.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>

#include "internal/db/model/status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/metadata_value.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace fetchledger::migration {

using db::model::PostStatus;
using db::model::SessionStatus;
using observability::IntField;
using observability::StringField;

namespace {

const char* const kSubdirectories[] = {".redditdl", "downloads", "sessions"};

struct SessionIdentity {
  std::string session_id;
  std::string target_type  = "user";
  std::string target_value = "unknown";
};

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool MatchesTopLevelPattern(const std::string& name) {
  if (EndsWith(name, ".session.json")) {
    return true;
  }
  if (!EndsWith(name, ".json")) {
    return false;
  }
  return StartsWith(name, "session_") || StartsWith(name, "redditdl_");
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Throws util::IOError / util::InvalidArgument.
google::protobuf::Struct ReadDocument(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::IOError("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw util::IOError("failed reading " + path.string());
  }
  return util::ParseJsonObject(buffer.str());
}

// "<prefix><value>_..." somewhere in the lowercased file stem.
std::optional<std::string> ValueAfter(const std::string& stem, std::string_view prefix) {
  const auto pos = stem.find(prefix);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const auto start = pos + prefix.size();
  return stem.substr(start, stem.find('_', start) - start);
}

SessionIdentity ExtractIdentity(const google::protobuf::Struct& doc, const std::filesystem::path& path) {
  SessionIdentity id;

  const auto session_id = util::FindStringField(doc, "session_id");
  id.session_id         = (session_id && !session_id->empty()) ? *session_id : path.stem().string();

  if (const auto v = util::FindStringField(doc, "target_user")) {
    id.target_type  = "user";
    id.target_value = *v;
  } else if (const auto v = util::FindStringField(doc, "target_subreddit")) {
    id.target_type  = "subreddit";
    id.target_value = *v;
  } else if (const auto v = util::FindStringField(doc, "target_url")) {
    id.target_type  = "url";
    id.target_value = *v;
  } else if (const auto* config = util::FindField(doc, "config"); config && config->has_struct_value()) {
    if (const auto v = util::FindStringField(config->struct_value(), "target_user")) {
      id.target_type  = "user";
      id.target_value = *v;
    }
  }

  if (id.target_value == "unknown") {
    const std::string stem = Lower(path.stem().string());
    if (const auto user = ValueAfter(stem, "user_")) {
      id.target_type  = "user";
      id.target_value = *user;
    } else if (const auto sub = ValueAfter(stem, "subreddit_")) {
      id.target_type  = "subreddit";
      id.target_value = *sub;
    }
  }

  return id;
}

// Fill in the fields downstream stages expect; anything else the legacy
// post carried is kept as is.
google::protobuf::Struct NormalizePost(const google::protobuf::Struct& post) {
  google::protobuf::Struct out;
  auto&                    f = *out.mutable_fields();
  f["id"]                    = util::MakeString("unknown");
  f["title"]                 = util::MakeString("");
  f["url"]                   = util::MakeString("");
  f["author"]                = util::MakeString("");
  f["subreddit"]             = util::MakeString("");
  f["created_utc"]           = util::MakeNumber(0);
  f["score"]                 = util::MakeNumber(0);
  f["num_comments"]          = util::MakeNumber(0);
  f["is_nsfw"]               = util::MakeBool(false);
  f["is_self"]               = util::MakeBool(false);
  f["selftext"]              = util::MakeString("");
  f["media_url"]             = util::MakeNull();
  f["date_iso"]              = util::MakeString("");

  for (const auto& [key, value] : post.fields()) {
    f[key] = value;
  }
  return out;
}

std::vector<google::protobuf::Struct> CollectPosts(const google::protobuf::Struct& doc) {
  std::vector<google::protobuf::Struct> out;
  const auto*                           posts = util::FindField(doc, "posts");
  if (!posts) {
    return out;
  }

  if (posts->has_list_value()) {
    for (const auto& item : posts->list_value().values()) {
      if (item.has_struct_value()) {
        out.push_back(item.struct_value());
      }
    }
  } else if (posts->has_struct_value()) {
    // map keyed by post id
    for (const auto& [key, item] : posts->struct_value().fields()) {
      if (item.has_struct_value()) {
        out.push_back(item.struct_value());
      }
    }
  }
  return out;
}

std::optional<std::int64_t> NumberField(const google::protobuf::Struct& object, std::string_view key) {
  const auto* value = util::FindField(object, key);
  if (!value || !value->has_number_value()) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(value->number_value());
}

std::optional<std::string> NonEmptyString(const google::protobuf::Struct& object, std::string_view key) {
  auto value = util::FindStringField(object, key);
  if (value && value->empty()) {
    return std::nullopt;
  }
  return value;
}

void MigratePosts(const google::protobuf::Struct& doc, const std::string& session_id, state::StateManager& state) {
  for (const auto& post : CollectPosts(doc)) {
    const auto normalized = NormalizePost(post);
    try {
      state.SavePost(session_id, normalized, PostStatus::kProcessed);
    } catch (const std::exception& e) {
      FETCHLEDGER_LOG_WARN("Skipping legacy post",
                           {StringField("session", session_id),
                            StringField("post", util::FindStringField(normalized, "id").value_or("unknown")),
                            StringField("error", e.what())});
    }
  }
}

void MigrateDownloads(const google::protobuf::Struct& doc, const std::string& session_id, state::StateManager& state) {
  const auto* downloads = util::FindField(doc, "downloads");
  if (!downloads || !downloads->has_list_value()) {
    return;
  }

  for (const auto& item : downloads->list_value().values()) {
    if (!item.has_struct_value()) {
      continue;
    }
    const auto& d       = item.struct_value();
    const auto  post_id = util::FindStringField(d, "post_id").value_or("unknown");

    try {
      const auto id = state.AddDownload(post_id,
                                        session_id,
                                        util::FindStringField(d, "url").value_or(""),
                                        util::FindStringField(d, "filename").value_or(""),
                                        NonEmptyString(d, "local_path"));

      const auto status = util::FindStringField(d, "status").value_or("");
      if (status == "completed") {
        state.MarkDownloadCompleted(id, NumberField(d, "file_size"), NonEmptyString(d, "checksum"));
      } else if (status == "failed") {
        state.MarkDownloadFailed(id, util::FindStringField(d, "error").value_or("Migration: status was failed"));
      }
    } catch (const std::exception& e) {
      FETCHLEDGER_LOG_WARN("Skipping legacy download",
                           {StringField("session", session_id), StringField("post", post_id), StringField("error", e.what())});
    }
  }
}

void MigrateMetadata(const google::protobuf::Struct& doc, const std::string& session_id, state::StateManager& state) {
  const auto* metadata = util::FindField(doc, "metadata");
  if (!metadata || !metadata->has_struct_value()) {
    return;
  }

  for (const auto& [key, value] : metadata->struct_value().fields()) {
    try {
      state.SetMetadata(session_id, key, state::MetadataValue::Infer(value));
    } catch (const std::exception& e) {
      FETCHLEDGER_LOG_WARN("Skipping legacy metadata", {StringField("session", session_id), StringField("key", key), StringField("error", e.what())});
    }
  }
}

void RestoreStatus(const google::protobuf::Struct& doc, const std::string& session_id, state::StateManager& state) {
  const auto status = db::model::ParseSessionStatus(util::FindStringField(doc, "status").value_or("completed"));
  if (!status || *status == SessionStatus::kActive) {
    return;
  }

  std::optional<util::TimePoint> end_time;
  if (const auto text = util::FindStringField(doc, "end_time")) {
    end_time = util::ParseTimestamp(*text);
  }
  state.UpdateSessionStatus(session_id, *status, end_time);
}

} // namespace

std::string_view ToString(MigrationStatus status) {
  switch (status) {
    case MigrationStatus::kCompleted:
      return "completed";
    case MigrationStatus::kPartial:
      return "partial";
  }
  return "unknown";
}

const std::vector<std::string>& LegacyIndicatorKeys() {
  static const std::vector<std::string> kKeys = {"posts", "downloads", "session_id", "target_user", "config", "metadata", "created_at"};
  return kKeys;
}

bool IsLegacySessionDocument(const google::protobuf::Struct& document) {
  int found = 0;
  for (const auto& key : LegacyIndicatorKeys()) {
    if (document.fields().count(key) > 0) {
      ++found;
    }
  }
  return found >= 2;
}

std::vector<std::filesystem::path> FindLegacySessionFiles(const std::filesystem::path& search_dir) {
  std::set<std::filesystem::path> candidates;
  std::error_code                 ec;

  for (const auto& entry : std::filesystem::directory_iterator(search_dir, ec)) {
    if (entry.is_regular_file(ec) && MatchesTopLevelPattern(entry.path().filename().string())) {
      candidates.insert(std::filesystem::weakly_canonical(entry.path(), ec));
    }
  }

  for (const char* sub : kSubdirectories) {
    const auto dir = search_dir / sub;
    if (!std::filesystem::is_directory(dir, ec)) {
      continue;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
      if (entry.is_regular_file(ec) && entry.path().extension() == ".json") {
        candidates.insert(std::filesystem::weakly_canonical(entry.path(), ec));
      }
    }
  }

  std::vector<std::filesystem::path> out;
  for (const auto& path : candidates) {
    try {
      if (IsLegacySessionDocument(ReadDocument(path))) {
        out.push_back(path);
      }
    } catch (const std::exception& e) {
      FETCHLEDGER_LOG_DEBUG("Skipping unreadable JSON file", {StringField("path", path.string()), StringField("error", e.what())});
    }
  }
  return out;
}

std::string MigrateLegacySession(const std::filesystem::path&    path,
                                 state::StateManager&            state,
                                 const google::protobuf::Struct& default_config) {
  FETCHLEDGER_LOG_INFO("Migrating legacy session", {StringField("path", path.string())});

  google::protobuf::Struct doc;
  try {
    doc = ReadDocument(path);
  } catch (const std::exception& e) {
    throw util::MigrationError("Cannot read legacy session file " + path.string() + ": " + e.what());
  }

  const auto        identity   = ExtractIdentity(doc, path);
  const std::string session_id = state.CreateSession(default_config, identity.target_type, identity.target_value, identity.session_id);

  MigratePosts(doc, session_id, state);
  MigrateDownloads(doc, session_id, state);
  MigrateMetadata(doc, session_id, state);
  RestoreStatus(doc, session_id, state);
  state.RecomputeSessionCounters(session_id);

  FETCHLEDGER_LOG_INFO("Migrated legacy session", {StringField("session", session_id), StringField("path", path.string())});
  return session_id;
}

MigrationReport MigrateLegacySessions(const MigrationOptions& options, state::StateManager& state) {
  MigrationReport report;

  std::vector<std::filesystem::path> files = options.files;
  if (files.empty()) {
    std::vector<std::filesystem::path> dirs = options.search_dirs;
    if (dirs.empty()) {
      dirs.push_back(std::filesystem::current_path());
    }

    std::set<std::filesystem::path> seen;
    for (const auto& dir : dirs) {
      for (auto& path : FindLegacySessionFiles(dir)) {
        if (seen.insert(path).second) {
          files.push_back(std::move(path));
        }
      }
    }
  }

  report.files_found = static_cast<std::int64_t>(files.size());
  if (files.empty()) {
    FETCHLEDGER_LOG_INFO("No legacy session files found");
    return report;
  }

  for (const auto& path : files) {
    try {
      const auto session_id = MigrateLegacySession(path, state, options.default_config);
      ++report.files_migrated;
      report.migrated_sessions.push_back(session_id);
    } catch (const std::exception& e) {
      const std::string message = "Failed to migrate " + path.string() + ": " + e.what();
      FETCHLEDGER_LOG_ERROR(message);
      report.errors.push_back(message);
      continue;
    }

    if (options.backup) {
      std::filesystem::path backup = path;
      backup += ".backup";

      std::error_code ec;
      std::filesystem::rename(path, backup, ec);
      if (ec) {
        const std::string message = "Migrated " + path.string() + " but could not back it up: " + ec.message();
        FETCHLEDGER_LOG_WARN(message);
        report.errors.push_back(message);
      } else {
        FETCHLEDGER_LOG_INFO("Backed up legacy session file", {StringField("path", backup.string())});
      }
    }
  }

  if (!report.errors.empty()) {
    report.status = MigrationStatus::kPartial;
  }

  FETCHLEDGER_LOG_INFO("Legacy migration finished",
                       {IntField("found", report.files_found), IntField("migrated", report.files_migrated), StringField("status", ToString(report.status))});
  return report;
}

} // namespace fetchledger::migration
