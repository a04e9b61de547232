#include "config_fingerprint.hpp"

#include "internal/util/checksum.hpp"
#include "internal/util/json.hpp"

namespace fetchledger::state {

const std::vector<std::string>& VolatileConfigKeys() {
  static const std::vector<std::string> kKeys = {"created", "session_dir", "verbose", "debug"};
  return kKeys;
}

std::string ConfigFingerprint(const google::protobuf::Struct& config) {
  google::protobuf::Struct stable = config;
  for (const auto& key : VolatileConfigKeys()) {
    stable.mutable_fields()->erase(key);
  }

  return util::Sha256Hex(util::CanonicalJson(stable)).substr(0, 16);
}

} // namespace fetchledger::state
