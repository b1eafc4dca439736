#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_record_store.hpp"

namespace rowsweep::db::memory {

/*
  Transaction = write set over the committed tickets.

  Reads see the committed rows with this transaction's own writes laid
  on top. Nothing is copied up front, so a transaction holds only the
  rows it wrote. Commit fails with SerializationFailure when it has
  writes and another commit landed after Begin().
*/
class MemoryTransaction final : public db::Transaction {
 public:
  struct WriteSet {
    std::map<std::int64_t, std::string> upserts;
    bool                                cleared = false;
    std::int64_t                        next_id = 1;

    bool Dirty() const {
      return cleared || !upserts.empty();
    }
  };

  explicit MemoryTransaction(MemoryRecordStore& store);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  WriteSet& Writes() {
    return writes_;
  }
  const WriteSet& Writes() const {
    return writes_;
  }

 private:
  MemoryRecordStore& store_;
  WriteSet           writes_;
  std::uint64_t      read_version_ = 0;
  bool               committed_    = false;
  bool               rolled_back_  = false;
};

} // namespace rowsweep::db::memory
