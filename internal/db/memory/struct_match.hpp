#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <vector>

#include "internal/db/api/query.hpp"

namespace jobstore::db::memory {

/*
  Predicate evaluation over a protobuf Struct body.

  Type rules follow JSON comparison in the SQL backends:
    number vs number  -> numeric
    string vs string  -> lexicographic
    bool   vs bool    -> Eq / Ne only
  Any other pairing (including a missing field) only satisfies Ne.
*/

bool Matches(const google::protobuf::Struct& body, const Predicate& predicate);
bool MatchesAll(const google::protobuf::Struct& body, const std::vector<Predicate>& predicates);

// Ordering for OrderBy: missing < bool < number < string; returns <0, 0, >0.
int CompareFields(const google::protobuf::Struct& a, const google::protobuf::Struct& b, const std::string& field);

} // namespace jobstore::db::memory
