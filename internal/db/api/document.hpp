#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>

namespace jobstore::db {

/*
  Document

  A self-contained JSON-like record addressed by (collection, id, partition key).

  Envelope fields are owned by the store:
    etag          — version token, changes on every write
    timestamp_ms  — store-assigned write time
    expire_at_ms  — absolute expiry; an expired document is invisible

  The body is free-form JSON; typed views live in documents.proto and are
  converted by db::codec.
*/
struct Document {
  std::string            id;
  std::string            partition_key;
  std::string            document_type;
  std::string            etag;
  int64_t                timestamp_ms = 0;
  std::optional<int64_t> expire_at_ms;

  google::protobuf::Struct body;

  bool IsExpired(int64_t now_ms) const {
    return expire_at_ms.has_value() && *expire_at_ms <= now_ms;
  }
};

} // namespace jobstore::db
