#include "status.hpp"

namespace fetchledger::db::model {

std::string_view ToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kActive:
      return "active";
    case SessionStatus::kPaused:
      return "paused";
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kFailed:
      return "failed";
  }
  return "active";
}

std::string_view ToString(PostStatus status) {
  switch (status) {
    case PostStatus::kPending:
      return "pending";
    case PostStatus::kProcessed:
      return "processed";
    case PostStatus::kSkipped:
      return "skipped";
    case PostStatus::kFailed:
      return "failed";
  }
  return "pending";
}

std::string_view ToString(DownloadStatus status) {
  switch (status) {
    case DownloadStatus::kPending:
      return "pending";
    case DownloadStatus::kDownloading:
      return "downloading";
    case DownloadStatus::kCompleted:
      return "completed";
    case DownloadStatus::kFailed:
      return "failed";
  }
  return "pending";
}

std::optional<SessionStatus> ParseSessionStatus(std::string_view value) {
  if (value == "active") return SessionStatus::kActive;
  if (value == "paused") return SessionStatus::kPaused;
  if (value == "completed") return SessionStatus::kCompleted;
  if (value == "failed") return SessionStatus::kFailed;
  return std::nullopt;
}

std::optional<PostStatus> ParsePostStatus(std::string_view value) {
  if (value == "pending") return PostStatus::kPending;
  if (value == "processed") return PostStatus::kProcessed;
  if (value == "skipped") return PostStatus::kSkipped;
  if (value == "failed") return PostStatus::kFailed;
  return std::nullopt;
}

std::optional<DownloadStatus> ParseDownloadStatus(std::string_view value) {
  if (value == "pending") return DownloadStatus::kPending;
  if (value == "downloading") return DownloadStatus::kDownloading;
  if (value == "completed") return DownloadStatus::kCompleted;
  if (value == "failed") return DownloadStatus::kFailed;
  return std::nullopt;
}

} // namespace fetchledger::db::model
