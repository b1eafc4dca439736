#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "internal/sweep/progress_estimator.hpp"

namespace rowsweep::sweep {

/*
  Single self-overwriting terminal line:

      Progress: 42.0% Remain: 17s

  Finish() ends the line so following output starts on a clean row.
*/
class ProgressLine {
 public:
  explicit ProgressLine(std::ostream& out, bool enabled = true);

  void Render(const ProgressSnapshot& snapshot);
  void Finish();

  static std::string Format(const ProgressSnapshot& snapshot);

 private:
  std::ostream& out_;
  bool          enabled_;
  bool          pending_     = false;
  std::size_t   last_length_ = 0;
};

} // namespace rowsweep::sweep
