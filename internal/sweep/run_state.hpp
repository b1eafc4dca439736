#pragma once

#include <cstdint>
#include <functional>

namespace rowsweep::sweep {

enum class RunState : std::uint8_t {
  kInit          = 0,
  kResuming      = 1,
  kRunning       = 2,
  kCheckpointing = 3,
  kDone          = 4,
  kInterrupted   = 5,
};

// Why a run left RUNNING early. Both causes share the CHECKPOINTING path.
enum class StopCause : std::uint8_t {
  kNone        = 0,
  kInterrupted = 1,
  kFailed      = 2,
};

const char* ToString(RunState state);
const char* ToString(StopCause cause);

constexpr bool CanTransition(RunState from, RunState to) {
  switch (from) {
    case RunState::kInit:
      return to == RunState::kResuming;
    case RunState::kResuming:
      return to == RunState::kRunning;
    case RunState::kRunning:
      return to == RunState::kCheckpointing || to == RunState::kDone;
    case RunState::kCheckpointing:
      return to == RunState::kInterrupted;
    case RunState::kDone:
    case RunState::kInterrupted:
      return false;
  }
  return false;
}

// Polled between pages; true asks the run to stop.
using StopToken = std::function<bool()>;

} // namespace rowsweep::sweep
