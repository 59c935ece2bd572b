#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace jobstore::util {

/*
  UUID helpers

  Job ids and lock owner tokens are random RFC4122 v4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// 8-4-4-4-12 form
std::string ToString(const UUID& id);

// 32 hex chars, no dashes
std::string ToCompactString(const UUID& id);

UUID FromString(const std::string& str);

} // namespace jobstore::util
