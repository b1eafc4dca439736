#include "internal/sweep/orchestrator.hpp"

#include <algorithm>
#include <string>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/sweep/progress_estimator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rowsweep::sweep {

using observability::StringField;
using observability::UintField;

Orchestrator::Orchestrator(db::RecordStore& store, CheckpointStore& checkpoints, SweepOptions options,
                           ProgressLine* progress)
    : store_(store),
      checkpoints_(checkpoints),
      options_(options),
      progress_(progress),
      writer_(store),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
  if (options_.page_size == 0) {
    throw util::InvalidArgument("page size must be greater than zero");
  }
  if (options_.retry.max_attempts == 0) {
    options_.retry.max_attempts = 1;
  }
}

void Orchestrator::TransitionTo(RunState next) {
  if (!CanTransition(state_, next)) {
    throw std::logic_error(std::string("invalid run state transition ") + ToString(state_) + " -> " + ToString(next));
  }
  ROWSWEEP_LOG_DEBUG("run state", {StringField("from", ToString(state_)), StringField("to", ToString(next))});
  state_ = next;
}

std::uint64_t Orchestrator::CountRows() {
  auto backoff = options_.retry.initial_backoff;
  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      auto       tx    = store_.Begin();
      const auto count = store_.CountRecords(*tx);
      tx->Commit();
      return count;
    } catch (const util::StoreError& e) {
      if (!db::IsTransient(e.Code()) || attempt >= options_.retry.max_attempts) throw;
      ROWSWEEP_LOG_WARN("row count failed, retrying",
                        {UintField("attempt", attempt), StringField("error", e.what())});
      sleeper_(backoff);
      backoff = std::min(backoff * 2, options_.retry.max_backoff);
    }
  }
}

std::uint64_t Orchestrator::ResumePoint(const PageCursor& cursor) {
  auto checkpoint = checkpoints_.Load();
  if (!checkpoint) {
    return 1;
  }

  if (checkpoint->status == CheckpointStatus::kComplete) {
    ROWSWEEP_LOG_INFO("previous run completed, starting a new run",
                      {StringField("checkpoint", checkpoints_.Location())});
    return 1;
  }

  if (checkpoint->total_pages != cursor.TotalPages() || checkpoint->page_size != cursor.PageSize()) {
    ROWSWEEP_LOG_WARN("stale checkpoint discarded, starting from page 1",
                      {StringField("checkpoint", checkpoints_.Location()),
                       UintField("checkpoint_total_pages", checkpoint->total_pages),
                       UintField("total_pages", cursor.TotalPages()),
                       UintField("checkpoint_page_size", checkpoint->page_size),
                       UintField("page_size", cursor.PageSize())});
    return 1;
  }

  if (checkpoint->last_committed_page > cursor.TotalPages()) {
    ROWSWEEP_LOG_WARN("checkpoint page out of range, starting from page 1",
                      {StringField("checkpoint", checkpoints_.Location()),
                       UintField("last_committed_page", checkpoint->last_committed_page)});
    return 1;
  }

  ROWSWEEP_LOG_INFO("resuming from checkpoint",
                    {StringField("checkpoint", checkpoints_.Location()),
                     UintField("last_committed_page", checkpoint->last_committed_page),
                     UintField("total_pages", checkpoint->total_pages)});
  return checkpoint->last_committed_page + 1;
}

db::Result Orchestrator::ProcessPage(const PageDescriptor& page, PageFetcher& fetcher, RunReport& report) {
  try {
    auto tx      = store_.Begin();
    auto records = fetcher.Fetch(*tx, page);

    report.peak_page_records = std::max<std::uint64_t>(report.peak_page_records, records.size());
    if (records.size() != page.RowCount()) {
      ROWSWEEP_LOG_WARN("page row count differs from layout",
                        {UintField("page", page.index), UintField("expected", page.RowCount()),
                         UintField("fetched", records.size())});
    }

    for (auto& record : records) {
      record = mutator_.Apply(std::move(record));
    }

    auto result = writer_.Commit(*tx, records);
    if (result) {
      report.rows_committed += records.size();
    }
    return result;
  } catch (const util::StoreError& e) {
    return db::Result::Err(e.Code(), e.what());
  } catch (const std::exception& e) {
    return db::Result::Err(db::ErrorCode::InternalError, e.what());
  }
}

db::Result Orchestrator::ProcessPageWithRetry(const PageDescriptor& page, PageFetcher& fetcher,
                                              const StopToken& stop_requested, RunReport& report,
                                              bool& interrupted) {
  auto backoff = options_.retry.initial_backoff;

  for (std::uint32_t attempt = 1;; ++attempt) {
    auto result = ProcessPage(page, fetcher, report);
    if (result) {
      return result;
    }

    if (!db::IsTransient(result.code) || attempt >= options_.retry.max_attempts) {
      if (db::IsTransient(result.code)) {
        result.message = "retries exhausted after " + std::to_string(attempt) + " attempts: " + result.message;
      }
      return result;
    }

    if (stop_requested && stop_requested()) {
      interrupted = true;
      return result;
    }

    if (progress_) progress_->Finish();
    ROWSWEEP_LOG_WARN("page attempt failed, retrying",
                      {UintField("page", page.index), UintField("attempt", attempt),
                       StringField("code", db::ToString(result.code)), StringField("error", result.message),
                       UintField("backoff_ms", static_cast<std::uint64_t>(backoff.count()))});
    ++report.retries;
    sleeper_(backoff);
    backoff = std::min(backoff * 2, options_.retry.max_backoff);
  }
}

void Orchestrator::SaveCheckpoint(CheckpointStatus status, const std::string& cause,
                                  std::uint64_t last_committed_page, std::uint64_t total_pages) {
  Checkpoint checkpoint;
  checkpoint.last_committed_page = last_committed_page;
  checkpoint.total_pages         = total_pages;
  checkpoint.page_size           = options_.page_size;
  checkpoint.status              = status;
  checkpoint.stop_cause          = cause;
  checkpoint.updated_at          = util::Now();
  checkpoints_.Save(checkpoint);
}

RunReport Orchestrator::Run(const StopToken& stop_requested) {
  if (state_ != RunState::kInit) {
    throw std::logic_error("orchestrator runs only once");
  }

  const auto started = util::SteadyClock::now();
  RunReport  report;

  // INIT
  report.total_rows = CountRows();
  PageCursor cursor(report.total_rows, options_.page_size);
  report.total_pages = cursor.TotalPages();

  auto              fetcher = MakePageFetcher(options_.paging, store_);
  ProgressEstimator estimator(report.total_rows, options_.page_size);

  // RESUMING
  TransitionTo(RunState::kResuming);
  const auto first_page = ResumePoint(cursor);
  cursor.Seek(first_page);
  report.first_page          = first_page;
  report.last_committed_page = first_page - 1;

  // RUNNING
  TransitionTo(RunState::kRunning);
  ROWSWEEP_LOG_INFO("regenerate started",
                    {UintField("total_rows", report.total_rows), UintField("total_pages", report.total_pages),
                     UintField("page_size", options_.page_size), UintField("first_page", first_page),
                     StringField("paging", ToString(options_.paging))});

  while (!cursor.Done()) {
    if (stop_requested && stop_requested()) {
      report.cause = StopCause::kInterrupted;
      break;
    }

    const auto page         = cursor.Current();
    const auto page_started = util::SteadyClock::now();

    bool interrupted = false;
    auto result      = ProcessPageWithRetry(page, *fetcher, stop_requested, report, interrupted);
    if (!result) {
      report.cause = interrupted ? StopCause::kInterrupted : StopCause::kFailed;
      report.error = "page " + std::to_string(page.index) + ": " + db::ToString(result.code) + ": " + result.message;
      break;
    }

    report.last_committed_page = page.index;
    ++report.pages_committed;

    const auto snapshot =
        estimator.Update(page.end, std::chrono::duration<double>(util::SteadyClock::now() - page_started));
    if (progress_) progress_->Render(snapshot);

    cursor.Advance();
  }

  if (progress_) progress_->Finish();

  if (report.cause != StopCause::kNone) {
    // CHECKPOINTING
    TransitionTo(RunState::kCheckpointing);
    if (report.cause == StopCause::kFailed) {
      ROWSWEEP_LOG_ERROR("page failed, stopping",
                         {UintField("page", report.last_committed_page + 1),
                          UintField("committed_pages", report.last_committed_page),
                          UintField("total_pages", report.total_pages), StringField("error", report.error)});
    } else {
      ROWSWEEP_LOG_WARN("interrupted, stopping",
                        {UintField("committed_pages", report.last_committed_page),
                         UintField("total_pages", report.total_pages)});
    }

    SaveCheckpoint(CheckpointStatus::kInProgress, ToString(report.cause), report.last_committed_page,
                   report.total_pages);
    ROWSWEEP_LOG_INFO("checkpoint written", {StringField("checkpoint", checkpoints_.Location()),
                                             UintField("last_committed_page", report.last_committed_page)});
    TransitionTo(RunState::kInterrupted);
  } else {
    // DONE
    TransitionTo(RunState::kDone);
    SaveCheckpoint(CheckpointStatus::kComplete, "completed", report.total_pages, report.total_pages);
  }

  report.final_state     = state_;
  report.elapsed_seconds = util::SecondsSince(started);
  return report;
}

} // namespace rowsweep::sweep
