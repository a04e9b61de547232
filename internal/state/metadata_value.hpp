#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace fetchledger::state {

enum class MetadataType {
  kString,
  kNumber,
  kBoolean,
  kJson,
};

std::string_view             ToString(MetadataType type);
std::optional<MetadataType> ParseMetadataType(std::string_view value);

/*
  Typed session metadata value.

  Stored as text plus a type tag; the tag decides how the text is read back,
  so a boolean true comes back as a bool and never as the string "true".
*/
class MetadataValue {
 public:
  static MetadataValue String(std::string value);
  static MetadataValue Number(double value);
  static MetadataValue Bool(bool value);
  static MetadataValue Json(google::protobuf::Value value);

  // Pick the tag from a JSON value: objects, lists and null are json,
  // scalars map to their own tag.
  static MetadataValue Infer(const google::protobuf::Value& value);

  static MetadataValue Deserialize(MetadataType type, std::string_view text);

  MetadataType Type() const;

  const std::string&             AsString() const;
  double                         AsNumber() const;
  bool                           AsBool() const;
  const google::protobuf::Value& AsJson() const;

  std::string Serialize() const;

  google::protobuf::Value ToJsonValue() const;

  bool operator==(const MetadataValue& other) const;
  bool operator!=(const MetadataValue& other) const {
    return !(*this == other);
  }

 private:
  using Storage = std::variant<std::string, double, bool, google::protobuf::Value>;

  explicit MetadataValue(Storage value) : value_(std::move(value)) {
  }

  Storage value_;
};

} // namespace fetchledger::state
