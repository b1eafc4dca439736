#include "internal/sweep/page_cursor.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace rowsweep::sweep {

PageCursor::PageCursor(std::uint64_t total_rows, std::uint64_t page_size)
    : total_rows_(total_rows), page_size_(page_size), total_pages_(0) {
  if (page_size_ == 0) {
    throw util::InvalidArgument("page size must be greater than zero");
  }
  total_pages_ = total_rows_ / page_size_ + (total_rows_ % page_size_ != 0 ? 1 : 0);
}

PageDescriptor PageCursor::PageAt(std::uint64_t index) const {
  if (index == 0 || index > total_pages_) {
    throw std::out_of_range("page " + std::to_string(index) + " outside [1, " + std::to_string(total_pages_) + "]");
  }

  PageDescriptor page;
  page.index = index;
  page.size  = page_size_;
  page.begin = (index - 1) * page_size_;
  page.end   = std::min(total_rows_, index * page_size_);
  return page;
}

void PageCursor::Seek(std::uint64_t index) {
  if (index == 0 || index > total_pages_ + 1) {
    throw std::out_of_range("cannot seek to page " + std::to_string(index));
  }
  next_index_ = index;
}

PageDescriptor PageCursor::Current() const {
  return PageAt(next_index_);
}

void PageCursor::Advance() {
  if (!Done()) ++next_index_;
}

} // namespace rowsweep::sweep
