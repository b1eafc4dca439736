#pragma once

namespace rowsweep::db {

/*
  One unit of work against a RecordStore. A sweep page, a seed batch and
  a purge each run inside exactly one.

  - Writes are invisible to other transactions until Commit()
  - Rollback(), or destruction without Commit(), discards every write
  - Commit() throws util::StoreError; the caller treats the unit as failed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: write set over the committed rows
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;
};

}
