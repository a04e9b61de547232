#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/status.hpp"

namespace fetchledger::db::model {

struct PostRecord {
  // content-source id, unique across the store
  std::string id;
  std::string session_id;

  std::string discovered_at;

  // payload exactly as discovered; always carries "id"
  google::protobuf::Struct post_data;

  PostStatus status = PostStatus::kPending;

  std::int64_t               processing_attempts = 0;
  std::optional<std::string> last_attempt_at;
  std::optional<std::string> error_message;
};

} // namespace fetchledger::db::model
