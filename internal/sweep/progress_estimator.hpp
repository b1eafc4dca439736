#pragma once

#include <chrono>
#include <cstdint>
#include <limits>

namespace rowsweep::sweep {

struct ProgressSnapshot {
  double percent           = 0.0;
  double remaining_seconds = std::numeric_limits<double>::infinity();
};

/*
  Percent complete plus a smoothed time-remaining figure.

  Each committed page yields a raw estimate
      (total_rows - rows_processed) / page_size * elapsed_for_page
  and the displayed value only ever moves down to it. A page that runs
  slower than the previous ones never raises the displayed figure, so the
  estimate under-reacts to a slowdown and is rough early in the run.
*/
class ProgressEstimator {
 public:
  static constexpr double kUnknownRemaining = std::numeric_limits<double>::infinity();

  ProgressEstimator(std::uint64_t total_rows, std::uint64_t page_size);

  ProgressSnapshot Update(std::uint64_t rows_processed, std::chrono::duration<double> elapsed_for_page);

  double Percent() const {
    return percent_;
  }

  double DisplayedRemaining() const {
    return displayed_remaining_;
  }

  bool HasEstimate() const {
    return displayed_remaining_ != kUnknownRemaining;
  }

 private:
  std::uint64_t total_rows_;
  std::uint64_t page_size_;
  double        percent_             = 0.0;
  double        displayed_remaining_ = kUnknownRemaining;
};

} // namespace rowsweep::sweep
