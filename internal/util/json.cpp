#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

#include "internal/util/errors.hpp"

namespace fetchledger::util {

namespace {

void AppendEscaped(std::string& out, const std::string& value) {
  out.push_back('"');
  for (const unsigned char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

void AppendCanonical(std::string& out, const google::protobuf::Value& value);

void AppendCanonical(std::string& out, const google::protobuf::Struct& object) {
  std::vector<const std::string*> keys;
  keys.reserve(object.fields_size());
  for (const auto& field : object.fields()) {
    keys.push_back(&field.first);
  }
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  bool first = true;
  for (const auto* key : keys) {
    if (!first) out.push_back(',');
    first = false;
    AppendEscaped(out, *key);
    out.push_back(':');
    AppendCanonical(out, object.fields().at(*key));
  }
  out.push_back('}');
}

void AppendCanonical(std::string& out, const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      out += "null";
      break;
    case google::protobuf::Value::kNumberValue:
      out += FormatNumber(value.number_value());
      break;
    case google::protobuf::Value::kStringValue:
      AppendEscaped(out, value.string_value());
      break;
    case google::protobuf::Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      break;
    case google::protobuf::Value::kStructValue:
      AppendCanonical(out, value.struct_value());
      break;
    case google::protobuf::Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendCanonical(out, item);
      }
      out.push_back(']');
      break;
    }
  }
}

} // namespace

std::string FormatNumber(double value) {
  if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 9007199254740992.0) {
    return std::to_string(static_cast<long long>(value));
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", value);
  return buf;
}

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = pretty;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw InvalidArgument("Failed to serialize JSON: " + std::string(status.message()));
  }
  return json;
}

google::protobuf::Struct ParseJsonObject(std::string_view json) {
  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(std::string(json), &object);
  if (!status.ok()) {
    throw InvalidArgument("Invalid JSON object: " + std::string(status.message()));
  }
  return object;
}

google::protobuf::Value ParseJsonValue(std::string_view json) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw InvalidArgument("Invalid JSON value: " + std::string(status.message()));
  }
  return value;
}

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendCanonical(out, value);
  return out;
}

std::string CanonicalJson(const google::protobuf::Struct& object) {
  std::string out;
  AppendCanonical(out, object);
  return out;
}

google::protobuf::Value MakeString(std::string_view value) {
  google::protobuf::Value v;
  v.set_string_value(std::string(value));
  return v;
}

google::protobuf::Value MakeNumber(double value) {
  google::protobuf::Value v;
  v.set_number_value(value);
  return v;
}

google::protobuf::Value MakeBool(bool value) {
  google::protobuf::Value v;
  v.set_bool_value(value);
  return v;
}

google::protobuf::Value MakeNull() {
  google::protobuf::Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

google::protobuf::Value MakeStruct(google::protobuf::Struct value) {
  google::protobuf::Value v;
  *v.mutable_struct_value() = std::move(value);
  return v;
}

const google::protobuf::Value* FindField(const google::protobuf::Struct& object, std::string_view key) {
  auto it = object.fields().find(std::string(key));
  if (it == object.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string> FindStringField(const google::protobuf::Struct& object, std::string_view key) {
  const auto* value = FindField(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->kind_case() == google::protobuf::Value::kStringValue) {
    return value->string_value();
  }
  if (value->kind_case() == google::protobuf::Value::kNumberValue) {
    return FormatNumber(value->number_value());
  }
  return std::nullopt;
}

} // namespace fetchledger::util
