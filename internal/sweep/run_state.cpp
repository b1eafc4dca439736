#include "internal/sweep/run_state.hpp"

namespace rowsweep::sweep {

const char* ToString(RunState state) {
  switch (state) {
    case RunState::kInit:
      return "init";
    case RunState::kResuming:
      return "resuming";
    case RunState::kRunning:
      return "running";
    case RunState::kCheckpointing:
      return "checkpointing";
    case RunState::kDone:
      return "done";
    case RunState::kInterrupted:
      return "interrupted";
  }
  return "unknown";
}

const char* ToString(StopCause cause) {
  switch (cause) {
    case StopCause::kNone:
      return "none";
    case StopCause::kInterrupted:
      return "interrupted";
    case StopCause::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace rowsweep::sweep
