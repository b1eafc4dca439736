#include "memory_record_store.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace rowsweep::db::memory {

namespace {

using Tickets = std::map<std::int64_t, std::string>;

// Walks the committed tickets overlaid with a write set in id order,
// starting after `after`, until fn returns false.
template <typename Fn>
void VisitMerged(const Tickets& base, const MemoryTransaction::WriteSet& writes, std::optional<std::int64_t> after,
                 Fn&& fn) {
  auto b = writes.cleared ? base.end() : (after ? base.upper_bound(*after) : base.begin());
  auto w = after ? writes.upserts.upper_bound(*after) : writes.upserts.begin();

  while (b != base.end() || w != writes.upserts.end()) {
    const Tickets::value_type* row = nullptr;
    if (w == writes.upserts.end() || (b != base.end() && b->first < w->first)) {
      row = &*b++;
    } else {
      if (b != base.end() && b->first == w->first) ++b;
      row = &*w++;
    }
    if (!fn(*row)) return;
  }
}

} // namespace

MemoryRecordStore::MemoryRecordStore() = default;

std::unique_ptr<db::Transaction> MemoryRecordStore::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MemoryRecordStore::Exists(const MemoryTransaction& tx, std::int64_t id) const {
  const auto& writes = tx.Writes();
  return writes.upserts.contains(id) || (!writes.cleared && committed_.tickets.contains(id));
}

void MemoryRecordStore::NotePeak(const MemoryTransaction& tx) {
  peak_tx_records_ = std::max<std::uint64_t>(peak_tx_records_, tx.Writes().upserts.size());
}

std::uint64_t MemoryRecordStore::CountRecords(Transaction& t) {
  std::scoped_lock lock(mutex_);
  const auto&      writes = TX(t).Writes();
  if (writes.cleared) return writes.upserts.size();

  std::uint64_t count = committed_.tickets.size();
  for (const auto& [id, _] : writes.upserts) {
    if (!committed_.tickets.contains(id)) ++count;
  }
  return count;
}

std::vector<model::TicketRecord> MemoryRecordStore::FetchByOffset(Transaction& t, std::uint64_t offset,
                                                                  std::uint64_t limit) {
  std::scoped_lock                 lock(mutex_);
  std::vector<model::TicketRecord> out;
  std::uint64_t                    skipped = 0;
  VisitMerged(committed_.tickets, TX(t).Writes(), std::nullopt, [&](const Tickets::value_type& row) {
    if (skipped < offset) {
      ++skipped;
      return true;
    }
    if (out.size() >= limit) return false;
    out.push_back({row.first, row.second});
    return true;
  });
  return out;
}

std::vector<model::TicketRecord> MemoryRecordStore::FetchAfter(Transaction& t, std::optional<std::int64_t> after_id,
                                                               std::uint64_t limit) {
  std::scoped_lock                 lock(mutex_);
  std::vector<model::TicketRecord> out;
  VisitMerged(committed_.tickets, TX(t).Writes(), after_id, [&](const Tickets::value_type& row) {
    if (out.size() >= limit) return false;
    out.push_back({row.first, row.second});
    return true;
  });
  return out;
}

std::optional<std::int64_t> MemoryRecordStore::KeyAtOffset(Transaction& t, std::uint64_t offset) {
  std::scoped_lock            lock(mutex_);
  std::optional<std::int64_t> key;
  std::uint64_t               position = 0;
  VisitMerged(committed_.tickets, TX(t).Writes(), std::nullopt, [&](const Tickets::value_type& row) {
    if (position++ < offset) return true;
    key = row.first;
    return false;
  });
  return key;
}

Result MemoryRecordStore::UpdateTokens(Transaction& t, const std::vector<model::TicketRecord>& records) {
  std::scoped_lock lock(mutex_);
  auto&            tx = TX(t);
  for (const auto& r : records) {
    if (!Exists(tx, r.id)) return Result::Err(ErrorCode::NotFound, "ticket " + std::to_string(r.id));
  }
  for (const auto& r : records) {
    tx.Writes().upserts.insert_or_assign(r.id, r.token);
  }
  NotePeak(tx);
  return Result::Ok();
}

Result MemoryRecordStore::InsertRecords(Transaction& t, const std::vector<model::TicketRecord>& records) {
  std::scoped_lock lock(mutex_);
  auto&            tx     = TX(t);
  auto&            writes = tx.Writes();
  for (const auto& r : records) {
    const std::int64_t id = r.id != 0 ? r.id : writes.next_id;
    if (Exists(tx, id)) return Result::Err(ErrorCode::AlreadyExists, "ticket " + std::to_string(id));
    writes.upserts.emplace(id, r.token);
    if (id >= writes.next_id) writes.next_id = id + 1;
  }
  NotePeak(tx);
  return Result::Ok();
}

Result MemoryRecordStore::DeleteAll(Transaction& t) {
  std::scoped_lock lock(mutex_);
  auto&            writes = TX(t).Writes();
  writes.upserts.clear();
  writes.cleared = true;
  return Result::Ok();
}

std::uint64_t MemoryRecordStore::PeakTransactionRecords() const {
  std::scoped_lock lock(mutex_);
  return peak_tx_records_;
}

void MemoryRecordStore::ResetPeakTransactionRecords() {
  std::scoped_lock lock(mutex_);
  peak_tx_records_ = 0;
}

} // namespace rowsweep::db::memory
