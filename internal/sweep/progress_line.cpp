#include "internal/sweep/progress_line.hpp"

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace rowsweep::sweep {

ProgressLine::ProgressLine(std::ostream& out, bool enabled) : out_(out), enabled_(enabled) {
}

std::string ProgressLine::Format(const ProgressSnapshot& snapshot) {
  if (std::isinf(snapshot.remaining_seconds)) {
    return fmt::format("Progress: {:.1f}% Remain: ?s", snapshot.percent);
  }
  return fmt::format("Progress: {:.1f}% Remain: {:.0f}s", snapshot.percent, snapshot.remaining_seconds);
}

void ProgressLine::Render(const ProgressSnapshot& snapshot) {
  if (!enabled_) return;

  auto line = Format(snapshot);
  const std::size_t length = line.size();
  if (length < last_length_) {
    line.append(last_length_ - length, ' ');
  }
  last_length_ = length;

  out_ << '\r' << line << std::flush;
  pending_ = true;
}

void ProgressLine::Finish() {
  if (!pending_) return;
  out_ << '\n' << std::flush;
  pending_     = false;
  last_length_ = 0;
}

} // namespace rowsweep::sweep
