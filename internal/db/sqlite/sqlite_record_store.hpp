#pragma once

#include <memory>

#include "internal/db/api/record_store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace rowsweep::db::sqlite {

class SqliteRecordStore final : public db::RecordStore {
 public:
  explicit SqliteRecordStore(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace rowsweep::db::sqlite
