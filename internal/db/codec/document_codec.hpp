#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <string>

#include "internal/db/api/document.hpp"

namespace jobstore::db::codec {

/*
  Typed body <-> Document body.

  Bodies are converted through protobuf JSON so the persisted field names
  are the lowerCamel JSON names of documents.proto. Default-valued fields
  are always written so queries can match on them.

  Throws std::runtime_error on conversion failure.
*/

google::protobuf::Struct ToStruct(const google::protobuf::Message& message);

// Unknown body fields are ignored so newer writers stay readable.
void FromStruct(const google::protobuf::Struct& body, google::protobuf::Message* message);

std::string StructToJson(const google::protobuf::Struct& body);
google::protobuf::Struct JsonToStruct(const std::string& json);

template <typename Body>
Body Unpack(const Document& doc) {
  Body body;
  FromStruct(doc.body, &body);
  return body;
}

template <typename Body>
void Pack(const Body& body, Document* doc) {
  doc->body = ToStruct(body);
}

} // namespace jobstore::db::codec
