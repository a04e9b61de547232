#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>

namespace fetchledger::util {

/*
  JSON helpers on top of google::protobuf::Struct / Value.

  Post payloads, JSON metadata values, export documents and legacy session
  files are all handled as protobuf Struct/Value trees.
*/

// Integral values print without a fraction ("42"), others round-trip.
std::string FormatNumber(double value);

std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

// Throws InvalidArgument if the text is not a JSON object.
google::protobuf::Struct ParseJsonObject(std::string_view json);

// Any JSON value (object, array, scalar, null).
google::protobuf::Value ParseJsonValue(std::string_view json);

// Deterministic serialization: object keys sorted, no whitespace.
std::string CanonicalJson(const google::protobuf::Value& value);
std::string CanonicalJson(const google::protobuf::Struct& object);

google::protobuf::Value MakeString(std::string_view value);
google::protobuf::Value MakeNumber(double value);
google::protobuf::Value MakeBool(bool value);
google::protobuf::Value MakeNull();
google::protobuf::Value MakeStruct(google::protobuf::Struct value);

const google::protobuf::Value* FindField(const google::protobuf::Struct& object, std::string_view key);

// String field, or the integral form of a number field. nullopt otherwise.
std::optional<std::string> FindStringField(const google::protobuf::Struct& object, std::string_view key);

} // namespace fetchledger::util
