#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/ticket_record.hpp"

namespace rowsweep::db {

/*
  Ordered access to the ticket table.

  CRITICAL GUARANTEES:

  - Every read is ordered by id ascending; page boundaries computed by
    the sweep depend on this ordering
  - Reads never materialize more than `limit` rows
  - Writes require a Transaction and become visible only on Commit()

  Read failures throw util::StoreError, write failures return Result.
*/

class RecordStore {
 public:
  virtual ~RecordStore() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  virtual std::uint64_t CountRecords(Transaction&) = 0;

  virtual std::vector<model::TicketRecord> FetchByOffset(Transaction&, std::uint64_t offset, std::uint64_t limit) = 0;

  // Rows with id > after_id (all rows when after_id is empty).
  virtual std::vector<model::TicketRecord> FetchAfter(Transaction&, std::optional<std::int64_t> after_id,
                                                      std::uint64_t limit) = 0;

  // id of the row at a 0-based ordinal position, if there is one.
  virtual std::optional<std::int64_t> KeyAtOffset(Transaction&, std::uint64_t offset) = 0;

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  virtual Result UpdateTokens(Transaction&, const std::vector<model::TicketRecord>&) = 0;

  virtual Result InsertRecords(Transaction&, const std::vector<model::TicketRecord>&) = 0;

  virtual Result DeleteAll(Transaction&) = 0;
};

} // namespace rowsweep::db
