#pragma once

#include <cstdint>

namespace rowsweep::sweep {

/*
  One fixed-size slice of the id-ordered table.

  index is 1-based; rows [begin, end) in ordinal position.
  The final page of a table may hold fewer than `size` rows.
*/
struct PageDescriptor {
  std::uint64_t index = 0;
  std::uint64_t size  = 0;
  std::uint64_t begin = 0;
  std::uint64_t end   = 0;

  std::uint64_t RowCount() const {
    return end - begin;
  }
};

/*
  Deterministic page sequence over `total_rows` rows.

  Iteration can start at any page (resume) without visiting the ones
  before it. Seek(total_pages + 1) positions the cursor past the end.
*/
class PageCursor {
 public:
  PageCursor(std::uint64_t total_rows, std::uint64_t page_size);

  std::uint64_t TotalRows() const {
    return total_rows_;
  }
  std::uint64_t PageSize() const {
    return page_size_;
  }
  std::uint64_t TotalPages() const {
    return total_pages_;
  }

  // Throws std::out_of_range outside [1, TotalPages()].
  PageDescriptor PageAt(std::uint64_t index) const;

  // Throws std::out_of_range outside [1, TotalPages() + 1].
  void Seek(std::uint64_t index);

  bool Done() const {
    return next_index_ > total_pages_;
  }

  std::uint64_t NextIndex() const {
    return next_index_;
  }

  // Page at the cursor; the cursor must not be Done().
  PageDescriptor Current() const;
  void           Advance();

 private:
  std::uint64_t total_rows_;
  std::uint64_t page_size_;
  std::uint64_t total_pages_;
  std::uint64_t next_index_ = 1;
};

} // namespace rowsweep::sweep
