#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace rowsweep::db::sqlite {

/*
  One page, batch or purge on the sqlite file.

  BEGIN IMMEDIATE takes the write lock before the page is read, so a
  competing writer surfaces as SQLITE_BUSY (ErrorCode::Busy, retried)
  at Begin() rather than as a failed COMMIT after the work is done.
  A COMMIT that fails leaves the transaction open; the destructor
  rolls it back.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

}
