#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <filesystem>
#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fetchledger::config {

using fetchledger::runtime::config::RuntimeConfig;

namespace {

constexpr std::array<std::string_view, 4> kSynchronousModes = {"OFF", "NORMAL", "FULL", "EXTRA"};
constexpr std::array<std::string_view, 7> kLogLevels        = {"trace", "debug", "info", "warn", "error", "critical", "off"};

std::string Where(const YAML::Mark& mark) {
  if (mark.is_null()) {
    return "";
  }
  return " (line " + std::to_string(mark.line + 1) + ")";
}

google::protobuf::Value ScalarToValue(const YAML::Node& node) {
  const std::string& text = node.Scalar();

  // "!" is the tag of a quoted scalar: "12345" stays a string
  if (node.Tag() == "!") {
    return util::MakeString(text);
  }
  if (text == "true" || text == "false") {
    return util::MakeBool(text == "true");
  }
  if (text == "null" || text == "~") {
    return util::MakeNull();
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end && *end == '\0') {
    return util::MakeNumber(number);
  }
  return util::MakeString(text);
}

google::protobuf::Value ToValue(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return util::MakeNull();

    case YAML::NodeType::Scalar:
      return ScalarToValue(node);

    case YAML::NodeType::Sequence: {
      google::protobuf::Value out;
      auto*                   list = out.mutable_list_value();
      for (const auto& item : node) {
        *list->add_values() = ToValue(item);
      }
      return out;
    }

    case YAML::NodeType::Map: {
      google::protobuf::Struct object;
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw util::InvalidArgument("Invalid configuration: non-scalar key" + Where(entry.first.Mark()));
        }
        (*object.mutable_fields())[entry.first.Scalar()] = ToValue(entry.second);
      }
      return util::MakeStruct(std::move(object));
    }
  }
  throw util::InvalidArgument("Invalid configuration: unsupported YAML node" + Where(node.Mark()));
}

RuntimeConfig FromDocument(const YAML::Node& document) {
  RuntimeConfig config;
  if (document.IsNull()) {
    return config;
  }
  if (!document.IsMap()) {
    throw util::InvalidArgument("Invalid configuration: top level must be a mapping" + Where(document.Mark()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  const auto status = google::protobuf::util::JsonStringToMessage(util::ToJson(ToValue(document)), &config, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

template <std::size_t N>
bool OneOf(const std::array<std::string_view, N>& allowed, std::string_view value) {
  for (const auto candidate : allowed) {
    if (candidate == value) return true;
  }
  return false;
}

} // namespace

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& db = config.database();
  if (db.max_connections() > 0 && db.prewarm_connections() > db.max_connections()) {
    throw util::InvalidArgument("Invalid configuration: database.prewarm_connections (" + std::to_string(db.prewarm_connections()) +
                                ") exceeds database.max_connections (" + std::to_string(db.max_connections()) + ")");
  }
  if (!db.synchronous().empty() && !OneOf(kSynchronousModes, db.synchronous())) {
    throw util::InvalidArgument("Invalid configuration: database.synchronous must be OFF, NORMAL, FULL or EXTRA, got '" +
                                db.synchronous() + "'");
  }
  if (!config.logging().level().empty() && !OneOf(kLogLevels, config.logging().level())) {
    throw util::InvalidArgument("Invalid configuration: unknown logging.level '" + config.logging().level() + "'");
  }

  const auto& recovery = config.recovery();
  if (recovery.resumable_max_age_days() > 0 && recovery.abandoned_max_age_days() > 0 &&
      recovery.abandoned_max_age_days() < recovery.resumable_max_age_days()) {
    throw util::InvalidArgument("Invalid configuration: recovery.abandoned_max_age_days is shorter than recovery.resumable_max_age_days");
  }

  for (const auto& dir : config.migration().search_dirs()) {
    if (dir.empty()) {
      throw util::InvalidArgument("Invalid configuration: migration.search_dirs contains an empty path");
    }
  }
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw util::IOError("Cannot read config file " + path);
  }

  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::BadFile& e) {
    throw util::IOError("Cannot read config file " + path + ": " + e.what());
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("Malformed YAML in " + path + ": " + e.msg + Where(e.mark));
  }
  return FromDocument(document);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("Malformed YAML: " + e.msg + Where(e.mark));
  }
  return FromDocument(document);
}

} // namespace fetchledger::config
