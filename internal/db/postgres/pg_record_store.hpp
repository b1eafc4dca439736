#pragma once

#include <memory>

#include "internal/db/api/record_store.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace rowsweep::db::postgres {

class PgRecordStore final : public db::RecordStore {
 public:
  explicit PgRecordStore(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  std::uint64_t CountRecords(Transaction&) override;
  std::vector<model::TicketRecord> FetchByOffset(Transaction&, std::uint64_t offset, std::uint64_t limit) override;
  std::vector<model::TicketRecord> FetchAfter(Transaction&, std::optional<std::int64_t> after_id,
                                              std::uint64_t limit) override;
  std::optional<std::int64_t> KeyAtOffset(Transaction&, std::uint64_t offset) override;

  Result UpdateTokens(Transaction&, const std::vector<model::TicketRecord>&) override;
  Result InsertRecords(Transaction&, const std::vector<model::TicketRecord>&) override;
  Result DeleteAll(Transaction&) override;

  // Creates the ticket table if it does not exist.
  void BootstrapSchema();

 private:
  static PgTransaction& TX(Transaction&);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace rowsweep::db::postgres
