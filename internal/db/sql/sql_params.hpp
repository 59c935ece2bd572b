#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace jobstore::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so one list serves both.
*/

using Param = std::variant<std::nullptr_t, int64_t, double, std::string>;

using Params = std::vector<Param>;

} // namespace jobstore::db::sql
