#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <vector>

namespace fetchledger::state {

// Top-level config keys that change between otherwise identical runs.
const std::vector<std::string>& VolatileConfigKeys();

/*
  Stable identity of a logical run configuration.

  Volatile keys are dropped, the rest is serialized as canonical JSON
  (sorted keys) and hashed with sha256; the first 16 hex characters are the
  fingerprint. Same logical config -> same fingerprint, regardless of key
  order or volatile flags.
*/
std::string ConfigFingerprint(const google::protobuf::Struct& config);

} // namespace fetchledger::state
