#include "metadata_value.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fetchledger::state {

namespace {

const char* TypeName(MetadataType type) {
  return ToString(type).data();
}

} // namespace

std::string_view ToString(MetadataType type) {
  switch (type) {
    case MetadataType::kString:
      return "string";
    case MetadataType::kNumber:
      return "number";
    case MetadataType::kBoolean:
      return "boolean";
    case MetadataType::kJson:
      return "json";
  }
  return "string";
}

std::optional<MetadataType> ParseMetadataType(std::string_view value) {
  if (value == "string") return MetadataType::kString;
  if (value == "number") return MetadataType::kNumber;
  if (value == "boolean") return MetadataType::kBoolean;
  if (value == "json") return MetadataType::kJson;
  return std::nullopt;
}

MetadataValue MetadataValue::String(std::string value) {
  return MetadataValue(Storage(std::in_place_index<0>, std::move(value)));
}

MetadataValue MetadataValue::Number(double value) {
  return MetadataValue(Storage(std::in_place_index<1>, value));
}

MetadataValue MetadataValue::Bool(bool value) {
  return MetadataValue(Storage(std::in_place_index<2>, value));
}

MetadataValue MetadataValue::Json(google::protobuf::Value value) {
  return MetadataValue(Storage(std::in_place_index<3>, std::move(value)));
}

MetadataValue MetadataValue::Infer(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return String(value.string_value());
    case google::protobuf::Value::kNumberValue:
      return Number(value.number_value());
    case google::protobuf::Value::kBoolValue:
      return Bool(value.bool_value());
    default:
      return Json(value);
  }
}

MetadataValue MetadataValue::Deserialize(MetadataType type, std::string_view text) {
  switch (type) {
    case MetadataType::kString:
      return String(std::string(text));

    case MetadataType::kNumber: {
      const std::string value(text);
      char*             end    = nullptr;
      const double      number = std::strtod(value.c_str(), &end);
      if (value.empty() || !end || *end != '\0') {
        throw util::InvalidArgument("metadata value '" + value + "' is not a number");
      }
      return Number(number);
    }

    case MetadataType::kBoolean: {
      std::string lowered(text);
      std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return Bool(lowered == "true" || lowered == "1" || lowered == "yes");
    }

    case MetadataType::kJson:
      return Json(util::ParseJsonValue(text));
  }
  throw util::InvalidArgument("unknown metadata type");
}

MetadataType MetadataValue::Type() const {
  switch (value_.index()) {
    case 0:
      return MetadataType::kString;
    case 1:
      return MetadataType::kNumber;
    case 2:
      return MetadataType::kBoolean;
    default:
      return MetadataType::kJson;
  }
}

const std::string& MetadataValue::AsString() const {
  if (const auto* value = std::get_if<0>(&value_)) return *value;
  throw util::InvalidArgument(std::string("metadata value is ") + TypeName(Type()) + ", not string");
}

double MetadataValue::AsNumber() const {
  if (const auto* value = std::get_if<1>(&value_)) return *value;
  throw util::InvalidArgument(std::string("metadata value is ") + TypeName(Type()) + ", not number");
}

bool MetadataValue::AsBool() const {
  if (const auto* value = std::get_if<2>(&value_)) return *value;
  throw util::InvalidArgument(std::string("metadata value is ") + TypeName(Type()) + ", not boolean");
}

const google::protobuf::Value& MetadataValue::AsJson() const {
  if (const auto* value = std::get_if<3>(&value_)) return *value;
  throw util::InvalidArgument(std::string("metadata value is ") + TypeName(Type()) + ", not json");
}

std::string MetadataValue::Serialize() const {
  switch (Type()) {
    case MetadataType::kString:
      return AsString();
    case MetadataType::kNumber:
      return util::FormatNumber(AsNumber());
    case MetadataType::kBoolean:
      return AsBool() ? "true" : "false";
    case MetadataType::kJson:
      return util::CanonicalJson(AsJson());
  }
  return {};
}

google::protobuf::Value MetadataValue::ToJsonValue() const {
  switch (Type()) {
    case MetadataType::kString:
      return util::MakeString(AsString());
    case MetadataType::kNumber:
      return util::MakeNumber(AsNumber());
    case MetadataType::kBoolean:
      return util::MakeBool(AsBool());
    case MetadataType::kJson:
      return AsJson();
  }
  return util::MakeNull();
}

bool MetadataValue::operator==(const MetadataValue& other) const {
  if (Type() != other.Type()) {
    return false;
  }
  switch (Type()) {
    case MetadataType::kString:
      return AsString() == other.AsString();
    case MetadataType::kNumber:
      return AsNumber() == other.AsNumber();
    case MetadataType::kBoolean:
      return AsBool() == other.AsBool();
    case MetadataType::kJson:
      return util::CanonicalJson(AsJson()) == util::CanonicalJson(other.AsJson());
  }
  return false;
}

} // namespace fetchledger::state
