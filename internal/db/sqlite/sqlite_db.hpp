#pragma once

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace jobstore::db::sqlite {

// A failed sqlite3 call; code is the (extended) result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int code() const {
    return code_;
  }

 private:
  int code_;
};

/*
  Thin RAII wrapper around sqlite3*.

  The handle is opened FULLMUTEX, but callers that run multi-statement
  sequences (transactions) must still serialize access themselves.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Rows touched by the last INSERT/UPDATE/DELETE on this handle
  int Changes() const;

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
};

} // namespace jobstore::db::sqlite
