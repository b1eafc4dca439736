#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace rowsweep::sweep {

enum class CheckpointStatus {
  kInProgress,
  kComplete,
};

/*
  Resume point of a sweep.

  last_committed_page is only ever a page whose commit succeeded.
  A kComplete checkpoint means nothing is left to resume.
*/
struct Checkpoint {
  std::uint64_t    last_committed_page = 0;
  std::uint64_t    total_pages         = 0;
  std::uint64_t    page_size           = 0;
  CheckpointStatus status              = CheckpointStatus::kInProgress;
  std::string      stop_cause;
  util::TimePoint  updated_at{};
};

/*
  Durable storage for the single checkpoint of a sweep.

  Load() returns nothing for an absent or unreadable checkpoint; that is a
  normal outcome, not an error. Save() replaces the stored checkpoint
  atomically and throws util::CheckpointError if it cannot.
*/
class CheckpointStore {
 public:
  virtual ~CheckpointStore() = default;

  virtual std::optional<Checkpoint> Load() = 0;
  virtual void                      Save(const Checkpoint& checkpoint) = 0;

  // Where the checkpoint lives, for log lines.
  virtual std::string Location() const = 0;
};

} // namespace rowsweep::sweep
