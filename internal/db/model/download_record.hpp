#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/status.hpp"

namespace fetchledger::db::model {

struct DownloadRecord {
  std::int64_t id = 0;

  std::string post_id;
  std::string session_id;

  std::string                url;
  std::optional<std::string> local_path;
  std::optional<std::string> filename;

  std::optional<std::int64_t> file_size;

  DownloadStatus status            = DownloadStatus::kPending;
  std::int64_t   download_attempts = 0;

  std::optional<std::string> started_at;
  std::optional<std::string> completed_at;
  std::optional<std::string> error_message;

  // sha256 hex of the file content
  std::optional<std::string> checksum;

  // local_path if set, else filename
  std::optional<std::string> ResolvedPath() const {
    if (local_path && !local_path->empty()) return local_path;
    if (filename && !filename->empty()) return filename;
    return std::nullopt;
  }
};

} // namespace fetchledger::db::model
