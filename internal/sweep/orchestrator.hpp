#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "internal/db/api/record_store.hpp"
#include "internal/sweep/batch_writer.hpp"
#include "internal/sweep/checkpoint_store.hpp"
#include "internal/sweep/page_cursor.hpp"
#include "internal/sweep/page_fetcher.hpp"
#include "internal/sweep/progress_line.hpp"
#include "internal/sweep/run_state.hpp"
#include "internal/sweep/token_mutator.hpp"

namespace rowsweep::sweep {

struct RetryPolicy {
  std::uint32_t             max_attempts    = 3;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(100);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(5000);
};

struct SweepOptions {
  std::uint64_t  page_size = 1000;
  PagingStrategy paging    = PagingStrategy::kKeyset;
  RetryPolicy    retry;
};

struct RunReport {
  RunState      final_state = RunState::kInit;
  StopCause     cause       = StopCause::kNone;
  std::uint64_t total_rows  = 0;
  std::uint64_t total_pages = 0;

  // First page this invocation attempted; > 1 after a resume.
  std::uint64_t first_page          = 1;
  std::uint64_t last_committed_page = 0;
  std::uint64_t pages_committed     = 0;
  std::uint64_t rows_committed      = 0;
  std::uint64_t retries             = 0;

  // Largest number of records held at once.
  std::uint64_t peak_page_records = 0;

  double      elapsed_seconds = 0.0;
  std::string error;
};

/*
  Drives one regenerate run:

      INIT -> RESUMING -> RUNNING -> DONE
                             |
                             +-> CHECKPOINTING -> INTERRUPTED

  Pages are processed one at a time in increasing order, each inside its
  own transaction. The checkpoint is written on exactly one path, when
  the run stops early (interruption or unrecoverable failure), and marked
  complete on DONE. last_committed_page never points past a page whose
  commit has not succeeded.

  Failures while counting rows or reading the checkpoint propagate as
  exceptions and leave any stored checkpoint untouched.
*/
class Orchestrator {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  Orchestrator(db::RecordStore& store, CheckpointStore& checkpoints, SweepOptions options,
               ProgressLine* progress = nullptr);

  RunReport Run(const StopToken& stop_requested = {});

  RunState State() const {
    return state_;
  }

  // Replaces the backoff sleep between retries.
  void SetSleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
  }

 private:
  void          TransitionTo(RunState next);
  std::uint64_t CountRows();
  std::uint64_t ResumePoint(const PageCursor& cursor);

  db::Result ProcessPage(const PageDescriptor& page, PageFetcher& fetcher, RunReport& report);
  db::Result ProcessPageWithRetry(const PageDescriptor& page, PageFetcher& fetcher, const StopToken& stop_requested,
                                  RunReport& report, bool& interrupted);

  void SaveCheckpoint(CheckpointStatus status, const std::string& cause, std::uint64_t last_committed_page,
                      std::uint64_t total_pages);

  db::RecordStore& store_;
  CheckpointStore& checkpoints_;
  SweepOptions     options_;
  ProgressLine*    progress_;
  TokenMutator     mutator_;
  BatchWriter      writer_;
  Sleeper          sleeper_;
  RunState         state_ = RunState::kInit;
};

} // namespace rowsweep::sweep
