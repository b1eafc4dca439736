#pragma once

#include <vector>

#include "internal/db/api/record_store.hpp"

namespace rowsweep::sweep {

/*
  Persists one page of mutated tickets and commits its transaction.

  The page either commits as a whole or not at all: on any failure the
  transaction is left uncommitted and rolls back on destruction.
*/
class BatchWriter {
 public:
  explicit BatchWriter(db::RecordStore& store);

  db::Result Commit(db::Transaction& tx, const std::vector<db::model::TicketRecord>& records);

 private:
  db::RecordStore& store_;
};

} // namespace rowsweep::sweep
