#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "internal/state/state_manager.hpp"

namespace fetchledger::migration {

/*
  One-shot import of flat JSON session files written by older releases.

  A legacy document is a JSON object with (some of) posts, downloads,
  metadata, session_id, target_user/target_subreddit/target_url, config,
  status, end_time, created_at. Each file becomes one session.
*/

enum class MigrationStatus {
  kCompleted,
  kPartial,
};

std::string_view ToString(MigrationStatus status);

struct MigrationOptions {
  // Explicit files; when empty they are discovered under search_dirs.
  std::vector<std::filesystem::path> files;
  // Empty -> current directory.
  std::vector<std::filesystem::path> search_dirs;

  // Run config recorded for every migrated session.
  google::protobuf::Struct default_config;

  // Rename each migrated file to <name>.backup.
  bool backup = true;
};

struct MigrationReport {
  MigrationStatus          status         = MigrationStatus::kCompleted;
  std::int64_t             files_found    = 0;
  std::int64_t             files_migrated = 0;
  std::vector<std::string> errors;
  std::vector<std::string> migrated_sessions;
};

// Top-level keys that mark a legacy session document.
const std::vector<std::string>& LegacyIndicatorKeys();

// At least two indicator keys present.
bool IsLegacySessionDocument(const google::protobuf::Struct& document);

// Candidate files under search_dir that parse and look like legacy sessions.
// Sorted, no duplicates.
std::vector<std::filesystem::path> FindLegacySessionFiles(const std::filesystem::path& search_dir);

// Import one file. Returns the new session id. Throws util::MigrationError
// if the file cannot be read or parsed; per-post/download/metadata failures
// are logged and skipped.
std::string MigrateLegacySession(const std::filesystem::path&    path,
                                 state::StateManager&            state,
                                 const google::protobuf::Struct& default_config);

// Import a batch. A failing file never stops the others.
MigrationReport MigrateLegacySessions(const MigrationOptions& options, state::StateManager& state);

} // namespace fetchledger::migration
