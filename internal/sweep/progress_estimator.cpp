#include "internal/sweep/progress_estimator.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace rowsweep::sweep {

ProgressEstimator::ProgressEstimator(std::uint64_t total_rows, std::uint64_t page_size)
    : total_rows_(total_rows), page_size_(page_size) {
  if (page_size_ == 0) {
    throw util::InvalidArgument("page size must be greater than zero");
  }
}

ProgressSnapshot ProgressEstimator::Update(std::uint64_t rows_processed,
                                           std::chrono::duration<double> elapsed_for_page) {
  rows_processed = std::min(rows_processed, total_rows_);

  if (total_rows_ == 0) {
    percent_ = 100.0;
  } else {
    percent_ = static_cast<double>(rows_processed) / static_cast<double>(total_rows_) * 100.0;
  }

  const double remaining_rows = static_cast<double>(total_rows_ - rows_processed);
  const double estimate = remaining_rows / static_cast<double>(page_size_) * std::max(0.0, elapsed_for_page.count());

  if (estimate < displayed_remaining_) {
    displayed_remaining_ = estimate;
  }

  return {percent_, displayed_remaining_};
}

} // namespace rowsweep::sweep
