#pragma once

#include <string>

#include "config/config.pb.h"

namespace fetchledger::config {

/*
  Loads RuntimeConfig from YAML.

  The document is mapped onto google::protobuf::Value and handed to the
  protobuf JSON parser, so unknown keys and mistyped values are rejected
  with the field name in the message. Values that parse but make no sense
  (prewarm above the pool size, unknown synchronous mode) are rejected by
  Validate().

  Errors: util::IOError when the file cannot be read, util::InvalidArgument
  for everything else. An empty document is the default config.
*/
class ConfigLoader {
 public:
  static fetchledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fetchledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void Validate(const fetchledger::runtime::config::RuntimeConfig& config);
};

} // namespace fetchledger::config
