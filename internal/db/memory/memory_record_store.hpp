#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/record_store.hpp"

namespace rowsweep::db::memory {

class MemoryTransaction;

class MemoryRecordStore final : public db::RecordStore {
public:
  MemoryRecordStore();

  std::unique_ptr<Transaction> Begin() override;

  std::uint64_t CountRecords(Transaction&) override;
  std::vector<model::TicketRecord> FetchByOffset(Transaction&, std::uint64_t offset, std::uint64_t limit) override;
  std::vector<model::TicketRecord> FetchAfter(Transaction&, std::optional<std::int64_t> after_id,
                                              std::uint64_t limit) override;
  std::optional<std::int64_t> KeyAtOffset(Transaction&, std::uint64_t offset) override;

  Result UpdateTokens(Transaction&, const std::vector<model::TicketRecord>&) override;
  Result InsertRecords(Transaction&, const std::vector<model::TicketRecord>&) override;
  Result DeleteAll(Transaction&) override;

  // Largest write set any transaction has held since the last reset.
  std::uint64_t PeakTransactionRecords() const;
  void          ResetPeakTransactionRecords();

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::int64_t, std::string> tickets;
    std::int64_t                        next_id = 1;
  };

  bool Exists(const MemoryTransaction& tx, std::int64_t id) const;
  void NotePeak(const MemoryTransaction& tx);

  mutable std::mutex mutex_;
  State              committed_;
  std::uint64_t      committed_version_ = 0;
  std::uint64_t      peak_tx_records_   = 0;
};

}
