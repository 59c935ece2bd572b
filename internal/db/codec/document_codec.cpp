#include "document_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace jobstore::db::codec {

namespace json = google::protobuf::util;

google::protobuf::Struct ToStruct(const google::protobuf::Message& message) {
  json::JsonPrintOptions print_options;
  print_options.always_print_primitive_fields = true;

  std::string out;
  auto        status = json::MessageToJsonString(message, &out, print_options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return JsonToStruct(out);
}

void FromStruct(const google::protobuf::Struct& body, google::protobuf::Message* message) {
  const auto json_text = StructToJson(body);

  json::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = true;

  auto status = json::JsonStringToMessage(json_text, message, parse_options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to decode " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

std::string StructToJson(const google::protobuf::Struct& body) {
  std::string out;
  auto        status = json::MessageToJsonString(body, &out);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize document body: " + std::string(status.message()));
  }
  return out;
}

google::protobuf::Struct JsonToStruct(const std::string& json_text) {
  google::protobuf::Struct body;
  auto                     status = json::JsonStringToMessage(json_text, &body);
  if (!status.ok()) {
    throw std::runtime_error("Failed to parse document body: " + std::string(status.message()));
  }
  return body;
}

} // namespace jobstore::db::codec
