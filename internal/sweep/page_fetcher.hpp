#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/record_store.hpp"
#include "internal/sweep/page_cursor.hpp"

namespace rowsweep::sweep {

enum class PagingStrategy {
  kOffset,
  kKeyset,
};

const char* ToString(PagingStrategy strategy);

/*
  Reads the rows of one page inside the caller's transaction.

  Both strategies return identical rows for the same page as long as
  nobody else writes the table during the sweep.
*/
class PageFetcher {
 public:
  virtual ~PageFetcher() = default;

  virtual std::vector<db::model::TicketRecord> Fetch(db::Transaction& tx, const PageDescriptor& page) = 0;
};

// ORDER BY id LIMIT size OFFSET begin
class OffsetPageFetcher final : public PageFetcher {
 public:
  explicit OffsetPageFetcher(db::RecordStore& store);

  std::vector<db::model::TicketRecord> Fetch(db::Transaction& tx, const PageDescriptor& page) override;

 private:
  db::RecordStore& store_;
};

/*
  WHERE id > last_id ORDER BY id LIMIT size

  Remembers the last id it served. A page that does not directly follow
  the previous one (resume, retry) is re-anchored by ordinal position.
*/
class KeysetPageFetcher final : public PageFetcher {
 public:
  explicit KeysetPageFetcher(db::RecordStore& store);

  std::vector<db::model::TicketRecord> Fetch(db::Transaction& tx, const PageDescriptor& page) override;

 private:
  db::RecordStore&            store_;
  std::optional<std::uint64_t> last_index_;
  std::optional<std::int64_t>  last_id_;
};

std::unique_ptr<PageFetcher> MakePageFetcher(PagingStrategy strategy, db::RecordStore& store);

} // namespace rowsweep::sweep
