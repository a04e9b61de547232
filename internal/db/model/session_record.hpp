#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/status.hpp"

namespace fetchledger::db::model {

/*
  Persistent session row: one scraping run against one target.

  Counters are caches over the posts/downloads tables; triggers and
  StateManager keep them current, SessionRecovery repairs them.
*/
struct SessionRecord {
  std::string id;

  std::string created_at;
  std::string updated_at;

  // first 16 hex chars of sha256 over the canonical run config
  std::string config_hash;

  std::string target_type;
  std::string target_value;

  SessionStatus status = SessionStatus::kActive;

  std::int64_t total_posts          = 0;
  std::int64_t processed_posts      = 0;
  std::int64_t successful_downloads = 0;
  std::int64_t failed_downloads     = 0;

  std::optional<std::string> start_time;
  std::optional<std::string> end_time;

  // JSON object text
  std::string metadata;
};

} // namespace fetchledger::db::model
