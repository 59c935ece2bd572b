#pragma once

namespace jobstore::db {

/*
  Abstract backend transaction.

  Used inside a document store for multi-statement writes that must be
  atomic (conditional replace / delete). Not exposed to callers: the
  public contract is single-document atomicity.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsCommitted() const = 0;
};

}
