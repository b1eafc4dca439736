#include "memory_tx.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace rowsweep::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRecordStore& store) : store_(store) {
  std::scoped_lock lock(store_.mutex_);
  read_version_   = store_.committed_version_;
  writes_.next_id = store_.committed_.next_id;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(store_.mutex_);
  if (writes_.Dirty()) {
    if (store_.committed_version_ != read_version_) {
      throw util::StoreError(ErrorCode::SerializationFailure,
                             "transaction conflict: state was modified by a concurrent transaction");
    }

    auto& tickets = store_.committed_.tickets;
    if (writes_.cleared) tickets.clear();
    for (auto& [id, token] : writes_.upserts) {
      tickets.insert_or_assign(id, std::move(token));
    }
    store_.committed_.next_id = std::max(store_.committed_.next_id, writes_.next_id);
    store_.committed_version_++;
  }
  writes_    = WriteSet{};
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_      = WriteSet{};
  rolled_back_ = true;
}

} // namespace rowsweep::db::memory
