#pragma once

#include <optional>
#include <string_view>

namespace fetchledger::db::model {

enum class SessionStatus {
  kActive,
  kPaused,
  kCompleted,
  kFailed,
};

enum class PostStatus {
  kPending,
  kProcessed,
  kSkipped,
  kFailed,
};

enum class DownloadStatus {
  kPending,
  kDownloading,
  kCompleted,
  kFailed,
};

// Terminal sessions are eligible for retention cleanup.
constexpr bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kCompleted || status == SessionStatus::kFailed;
}

// A post counts as processed once the pipeline has acted on it.
constexpr bool IsTerminal(PostStatus status) {
  return status != PostStatus::kPending;
}

std::string_view ToString(SessionStatus status);
std::string_view ToString(PostStatus status);
std::string_view ToString(DownloadStatus status);

std::optional<SessionStatus>  ParseSessionStatus(std::string_view value);
std::optional<PostStatus>     ParsePostStatus(std::string_view value);
std::optional<DownloadStatus> ParseDownloadStatus(std::string_view value);

} // namespace fetchledger::db::model
