#include "internal/sweep/page_fetcher.hpp"

namespace rowsweep::sweep {

const char* ToString(PagingStrategy strategy) {
  switch (strategy) {
    case PagingStrategy::kOffset:
      return "offset";
    case PagingStrategy::kKeyset:
      return "keyset";
  }
  return "unknown";
}

OffsetPageFetcher::OffsetPageFetcher(db::RecordStore& store) : store_(store) {
}

std::vector<db::model::TicketRecord> OffsetPageFetcher::Fetch(db::Transaction& tx, const PageDescriptor& page) {
  return store_.FetchByOffset(tx, page.begin, page.RowCount());
}

KeysetPageFetcher::KeysetPageFetcher(db::RecordStore& store) : store_(store) {
}

std::vector<db::model::TicketRecord> KeysetPageFetcher::Fetch(db::Transaction& tx, const PageDescriptor& page) {
  std::optional<std::int64_t> after;

  if (page.begin > 0) {
    if (last_index_ && last_id_ && *last_index_ + 1 == page.index) {
      after = last_id_;
    } else {
      after = store_.KeyAtOffset(tx, page.begin - 1);
      if (!after) {
        // table is shorter than it was when the pages were laid out
        last_index_.reset();
        last_id_.reset();
        return {};
      }
    }
  }

  auto records = store_.FetchAfter(tx, after, page.RowCount());

  last_index_ = page.index;
  if (records.empty()) {
    last_id_.reset();
  } else {
    last_id_ = records.back().id;
  }
  return records;
}

std::unique_ptr<PageFetcher> MakePageFetcher(PagingStrategy strategy, db::RecordStore& store) {
  switch (strategy) {
    case PagingStrategy::kOffset:
      return std::make_unique<OffsetPageFetcher>(store);
    case PagingStrategy::kKeyset:
      return std::make_unique<KeysetPageFetcher>(store);
  }
  return std::make_unique<KeysetPageFetcher>(store);
}

} // namespace rowsweep::sweep
