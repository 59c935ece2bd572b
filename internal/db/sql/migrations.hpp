#pragma once

#include <string>
#include <vector>

namespace jobstore::db::sql {

/*
  Backend-agnostic schema execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs statements in order; the first failure propagates.
  Statements must be idempotent (CREATE ... IF NOT EXISTS).
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace jobstore::db::sql
