#pragma once

namespace weave::db {

/*
  Unit of atomicity for the engine.

  One decision cycle (history appends, run projection update, follow-on
  enqueues, ack of the decision task) is one Transaction, so a crash
  either keeps all of it or none of it.

  Every backend guarantees:
  - nothing is visible to other transactions before Commit()
  - reads through the transaction see its own writes
  - Rollback() or destruction without Commit() discards everything
  - write transactions on one store never interleave

  SQLite: BEGIN IMMEDIATE on the shared connection
  Postgres: pqxx::work on a pooled connection
  Memory: private copy of the state swapped in on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
