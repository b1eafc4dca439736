#include "internal/sweep/orchestrator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/db/memory/memory_record_store.hpp"
#include "internal/sweep/memory_checkpoint_store.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/faulty_record_store.hpp"
#include "tests/support/ticket_fixtures.hpp"

namespace {

using rowsweep::db::ErrorCode;
using rowsweep::db::memory::MemoryRecordStore;
using rowsweep::sweep::CheckpointStatus;
using rowsweep::sweep::MemoryCheckpointStore;
using rowsweep::sweep::Orchestrator;
using rowsweep::sweep::PagingStrategy;
using rowsweep::sweep::RunReport;
using rowsweep::sweep::RunState;
using rowsweep::sweep::StopCause;
using rowsweep::sweep::SweepOptions;
using rowsweep::testing::FaultyRecordStore;
using rowsweep::testing::TicketMap;

SweepOptions Options(std::uint64_t page_size, PagingStrategy paging = PagingStrategy::kKeyset) {
  SweepOptions options;
  options.page_size                = page_size;
  options.paging                   = paging;
  options.retry.max_attempts       = 3;
  options.retry.initial_backoff    = std::chrono::milliseconds(1);
  return options;
}

// Stops before page `after_pages + 1` of the invocation.
rowsweep::sweep::StopToken StopAfter(int after_pages) {
  auto polls = std::make_shared<int>(0);
  return [polls, after_pages] { return ++*polls > after_pages; };
}

RunReport RunOnce(rowsweep::db::RecordStore& store, MemoryCheckpointStore& checkpoints, const SweepOptions& options,
                  const rowsweep::sweep::StopToken& stop = {}) {
  Orchestrator orchestrator(store, checkpoints, options);
  orchestrator.SetSleeper([](std::chrono::milliseconds) {});
  return orchestrator.Run(stop);
}

void AssertAllRegenerated(const TicketMap& before, const TicketMap& after) {
  assert(before.size() == after.size());
  std::unordered_set<std::string> seen;
  for (const auto& [id, token] : after) {
    assert(before.at(id) != token);
    assert(rowsweep::util::IsCanonicalUUID(token));
    assert(seen.insert(token).second);
  }
}

void TestCleanRunRegeneratesEveryRow(PagingStrategy paging) {
  MemoryRecordStore store;
  rowsweep::testing::InsertTickets(store, 1050);
  const auto before = rowsweep::testing::Snapshot(store);

  MemoryCheckpointStore checkpoints;
  auto                  report = RunOnce(store, checkpoints, Options(100, paging));

  assert(report.final_state == RunState::kDone);
  assert(report.cause == StopCause::kNone);
  assert(report.total_pages == 11);
  assert(report.pages_committed == 11);
  assert(report.rows_committed == 1050);
  assert(report.last_committed_page == 11);

  AssertAllRegenerated(before, rowsweep::testing::Snapshot(store));

  auto checkpoint = checkpoints.Load();
  assert(checkpoint.has_value());
  assert(checkpoint->status == CheckpointStatus::kComplete);
  assert(checkpoints.History().size() == 1);
}

void TestZeroRowsCompletesImmediately() {
  MemoryRecordStore     store;
  MemoryCheckpointStore checkpoints;

  auto report = RunOnce(store, checkpoints, Options(100));
  assert(report.final_state == RunState::kDone);
  assert(report.total_pages == 0);
  assert(report.pages_committed == 0);
  assert(checkpoints.Load()->status == CheckpointStatus::kComplete);
}

void TestInterruptAfterPageThreeThenResume() {
  MemoryRecordStore store;
  rowsweep::testing::InsertTickets(store, 1000);
  const auto original = rowsweep::testing::Snapshot(store);
  const auto ids      = rowsweep::testing::OrderedIds(original);

  MemoryCheckpointStore checkpoints;
  auto                  first = RunOnce(store, checkpoints, Options(100), StopAfter(3));

  assert(first.final_state == RunState::kInterrupted);
  assert(first.cause == StopCause::kInterrupted);
  assert(first.last_committed_page == 3);

  auto checkpoint = checkpoints.Load();
  assert(checkpoint.has_value());
  assert(checkpoint->status == CheckpointStatus::kInProgress);
  assert(checkpoint->last_committed_page == 3);
  assert(checkpoint->total_pages == 10);
  assert(checkpoint->stop_cause == "interrupted");

  const auto interrupted = rowsweep::testing::Snapshot(store);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    const bool committed = i < 300;
    assert((interrupted.at(ids[i]) != original.at(ids[i])) == committed);
  }

  auto second = RunOnce(store, checkpoints, Options(100));
  assert(second.final_state == RunState::kDone);
  assert(second.first_page == 4);
  assert(second.pages_committed == 7);
  assert(second.rows_committed == 700);

  const auto resumed = rowsweep::testing::Snapshot(store);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i < 300) {
      assert(resumed.at(ids[i]) == interrupted.at(ids[i]));
    } else {
      assert(resumed.at(ids[i]) != original.at(ids[i]));
    }
  }
  AssertAllRegenerated(original, resumed);
  assert(checkpoints.Load()->status == CheckpointStatus::kComplete);
}

void TestInterruptBeforeFirstPage() {
  MemoryRecordStore store;
  rowsweep::testing::InsertTickets(store, 300);
  const auto original = rowsweep::testing::Snapshot(store);

  MemoryCheckpointStore checkpoints;
  auto                  report = RunOnce(store, checkpoints, Options(100), StopAfter(0));

  assert(report.final_state == RunState::kInterrupted);
  assert(report.pages_committed == 0);
  assert(checkpoints.Load()->last_committed_page == 0);
  assert(rowsweep::testing::Snapshot(store) == original);

  auto resumed = RunOnce(store, checkpoints, Options(100));
  assert(resumed.first_page == 1);
  assert(resumed.final_state == RunState::kDone);
}

void TestStaleCheckpointRestartsFromFirstPage() {
  MemoryRecordStore store;
  rowsweep::testing::InsertTickets(store, 1000);

  MemoryCheckpointStore checkpoints;
  auto                  first = RunOnce(store, checkpoints, Options(100), StopAfter(3));
  assert(checkpoints.Load()->total_pages == 10);
  assert(first.last_committed_page == 3);

  rowsweep::testing::InsertTickets(store, 500);
  const auto before = rowsweep::testing::Snapshot(store);

  auto second = RunOnce(store, checkpoints, Options(100));
  assert(second.total_pages == 15);
  assert(second.first_page == 1);
  assert(second.pages_committed == 15);
  AssertAllRegenerated(before, rowsweep::testing::Snapshot(store));
}

void TestChangedPageSizeInvalidatesCheckpoint() {
  MemoryRecordStore store;
  rowsweep::testing::InsertTickets(store, 1000);

  MemoryCheckpointStore checkpoints;
  RunOnce(store, checkpoints, Options(100), StopAfter(3));

  // same page count, different page size
  auto second = RunOnce(store, checkpoints, Options(101));
  assert(second.total_pages == 10);
  assert(second.first_page == 1);
}

void TestCheckpointNeverMovesBackwards() {
  MemoryRecordStore store;
  rowsweep::testing::InsertTickets(store, 1000);

  MemoryCheckpointStore checkpoints;
  RunOnce(store, checkpoints, Options(100), StopAfter(2));
  RunOnce(store, checkpoints, Options(100), StopAfter(0));
  RunOnce(store, checkpoints, Options(100), StopAfter(3));
  RunOnce(store, checkpoints, Options(100));

  const auto& history = checkpoints.History();
  assert(history.size() == 4);
  std::uint64_t previous = 0;
  for (const auto& checkpoint : history) {
    assert(checkpoint.last_committed_page >= previous);
    previous = checkpoint.last_committed_page;
  }
  assert(history[0].last_committed_page == 2);
  assert(history[1].last_committed_page == 2);
  assert(history[2].last_committed_page == 5);
  assert(history.back().status == CheckpointStatus::kComplete);
}

void TestTransientFailuresAreRetried() {
  MemoryRecordStore inner;
  rowsweep::testing::InsertTickets(inner, 500);
  const auto before = rowsweep::testing::Snapshot(inner);

  FaultyRecordStore store(inner);
  store.FailNextUpdates(2, ErrorCode::Busy);

  MemoryCheckpointStore checkpoints;
  Orchestrator          orchestrator(store, checkpoints, Options(100));

  std::vector<std::chrono::milliseconds> sleeps;
  orchestrator.SetSleeper([&](std::chrono::milliseconds delay) { sleeps.push_back(delay); });

  auto report = orchestrator.Run();
  assert(report.final_state == RunState::kDone);
  assert(report.retries == 2);
  assert(sleeps.size() == 2);
  assert(sleeps[1] == sleeps[0] * 2);
  AssertAllRegenerated(before, rowsweep::testing::Snapshot(inner));
}

void TestExhaustedRetriesCheckpointLastCommittedPage() {
  MemoryRecordStore inner;
  rowsweep::testing::InsertTickets(inner, 1000);
  const auto original = rowsweep::testing::Snapshot(inner);
  const auto ids      = rowsweep::testing::OrderedIds(original);

  FaultyRecordStore store(inner);
  store.FailUpdatesContaining(ids[450], ErrorCode::Busy);

  MemoryCheckpointStore checkpoints;
  auto                  failed = RunOnce(store, checkpoints, Options(100));

  assert(failed.final_state == RunState::kInterrupted);
  assert(failed.cause == StopCause::kFailed);
  assert(failed.last_committed_page == 4);
  assert(failed.retries == 2);
  assert(failed.error.find("page 5") != std::string::npos);

  auto checkpoint = checkpoints.Load();
  assert(checkpoint->last_committed_page == 4);
  assert(checkpoint->stop_cause == "failed");

  // the failed page rolled back as a unit
  const auto partial = rowsweep::testing::Snapshot(inner);
  for (std::size_t i = 400; i < 500; ++i) {
    assert(partial.at(ids[i]) == original.at(ids[i]));
  }

  store.ClearFaults();
  auto resumed = RunOnce(store, checkpoints, Options(100));
  assert(resumed.first_page == 5);
  assert(resumed.final_state == RunState::kDone);
  AssertAllRegenerated(original, rowsweep::testing::Snapshot(inner));
}

void TestNonTransientFailureIsNotRetried() {
  MemoryRecordStore inner;
  rowsweep::testing::InsertTickets(inner, 300);

  FaultyRecordStore store(inner);
  store.FailNextUpdates(1, ErrorCode::ConstraintViolation);

  MemoryCheckpointStore checkpoints;
  auto                  report = RunOnce(store, checkpoints, Options(100));

  assert(report.cause == StopCause::kFailed);
  assert(report.retries == 0);
  assert(store.UpdateCalls() == 1);
  assert(checkpoints.Load()->last_committed_page == 0);
}

void TestMemoryStaysWithinOnePage() {
  const std::uint64_t page_size = 100;
  for (std::uint64_t rows : {0ULL, 1ULL, 99ULL, 100ULL, 101ULL, 2500ULL}) {
    for (auto paging : {PagingStrategy::kOffset, PagingStrategy::kKeyset}) {
      MemoryRecordStore inner;
      rowsweep::testing::InsertTickets(inner, rows);
      inner.ResetPeakTransactionRecords();
      FaultyRecordStore store(inner);

      MemoryCheckpointStore checkpoints;
      auto                  report = RunOnce(store, checkpoints, Options(page_size, paging));

      assert(report.final_state == RunState::kDone);
      assert(report.rows_committed == rows);
      assert(report.peak_page_records <= page_size);
      assert(store.MaxFetched() <= page_size);
      // rows held by the page transaction itself, not just the fetched vector
      assert(inner.PeakTransactionRecords() <= page_size);
      assert(rows == 0 || inner.PeakTransactionRecords() > 0);
    }
  }
}

void TestProgressLineIsFinishedBeforeStopping() {
  MemoryRecordStore store;
  rowsweep::testing::InsertTickets(store, 300);

  std::ostringstream              out;
  rowsweep::sweep::ProgressLine   line(out);
  MemoryCheckpointStore           checkpoints;
  Orchestrator                    orchestrator(store, checkpoints, Options(100), &line);

  auto report = orchestrator.Run(StopAfter(2));
  assert(report.cause == StopCause::kInterrupted);

  const auto text = out.str();
  assert(text.find("Progress: 33.3%") != std::string::npos);
  assert(text.find("Progress: 66.7%") != std::string::npos);
  assert(!text.empty() && text.back() == '\n');
}

void TestTransientFetchFailureIsRetried(PagingStrategy paging) {
  MemoryRecordStore inner;
  rowsweep::testing::InsertTickets(inner, 450);
  const auto before = rowsweep::testing::Snapshot(inner);

  FaultyRecordStore store(inner);
  store.FailNextFetches(2, ErrorCode::IOError);

  MemoryCheckpointStore checkpoints;
  auto                  report = RunOnce(store, checkpoints, Options(100, paging));

  assert(report.final_state == RunState::kDone);
  assert(report.retries == 2);
  assert(store.FailedFetches() == 2);
  assert(report.rows_committed == 450);
  AssertAllRegenerated(before, rowsweep::testing::Snapshot(inner));
}

void TestTransientCommitFailureIsRetried() {
  MemoryRecordStore inner;
  rowsweep::testing::InsertTickets(inner, 300);
  const auto before = rowsweep::testing::Snapshot(inner);

  FaultyRecordStore store(inner);
  store.FailNextWriteCommits(1, ErrorCode::SerializationFailure);

  MemoryCheckpointStore checkpoints;
  auto                  report = RunOnce(store, checkpoints, Options(100));

  assert(report.final_state == RunState::kDone);
  assert(report.retries == 1);
  assert(store.FailedCommits() == 1);
  // the rolled-back attempt is not counted
  assert(report.rows_committed == 300);
  AssertAllRegenerated(before, rowsweep::testing::Snapshot(inner));
}

void TestExhaustedCommitRetriesStopTheRun() {
  MemoryRecordStore inner;
  rowsweep::testing::InsertTickets(inner, 300);
  const auto original = rowsweep::testing::Snapshot(inner);

  FaultyRecordStore store(inner);
  store.FailNextWriteCommits(3, ErrorCode::Busy);

  MemoryCheckpointStore checkpoints;
  auto                  report = RunOnce(store, checkpoints, Options(100));

  assert(report.cause == StopCause::kFailed);
  assert(report.last_committed_page == 0);
  assert(report.rows_committed == 0);
  assert(checkpoints.Load()->last_committed_page == 0);
  assert(rowsweep::testing::Snapshot(inner) == original);
}

void TestStopDuringBackoffIsAnInterruption() {
  MemoryRecordStore inner;
  rowsweep::testing::InsertTickets(inner, 300);
  const auto ids = rowsweep::testing::OrderedIds(rowsweep::testing::Snapshot(inner));

  FaultyRecordStore store(inner);
  store.FailUpdatesContaining(ids[150], ErrorCode::Busy);

  MemoryCheckpointStore checkpoints;
  Orchestrator          orchestrator(store, checkpoints, Options(100));

  bool stop = false;
  orchestrator.SetSleeper([&](std::chrono::milliseconds) { stop = true; });

  auto report = orchestrator.Run([&] { return stop; });

  assert(report.final_state == RunState::kInterrupted);
  assert(report.cause == StopCause::kInterrupted);
  assert(report.last_committed_page == 1);
  assert(report.retries == 1);
  assert(store.UpdateCalls() == 3);

  auto checkpoint = checkpoints.Load();
  assert(checkpoint->last_committed_page == 1);
  assert(checkpoint->stop_cause == "interrupted");
}

void TestPageFailureIsLoggedWithPageFields() {
  MemoryRecordStore inner;
  rowsweep::testing::InsertTickets(inner, 300);
  const auto ids = rowsweep::testing::OrderedIds(rowsweep::testing::Snapshot(inner));

  FaultyRecordStore store(inner);
  store.FailUpdatesContaining(ids[120], ErrorCode::ConstraintViolation);

  std::ostringstream logs;
  auto               logger = std::make_shared<spdlog::logger>(
      "orchestrator_test", std::make_shared<spdlog::sinks::ostream_sink_st>(logs));
  logger->set_pattern("%l %v");
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(logger);

  MemoryCheckpointStore checkpoints;
  auto                  report = RunOnce(store, checkpoints, Options(100));

  spdlog::set_default_logger(previous);

  assert(report.cause == StopCause::kFailed);
  const auto text = logs.str();
  assert(text.find("page failed, stopping page=2 committed_pages=1 total_pages=3") != std::string::npos);
  assert(text.find("error=\"page 2: ") != std::string::npos);
  assert(text.find("checkpoint written checkpoint=memory last_committed_page=1") != std::string::npos);
}

void TestOrchestratorRunsOnce() {
  MemoryRecordStore     store;
  MemoryCheckpointStore checkpoints;
  Orchestrator          orchestrator(store, checkpoints, Options(10));
  orchestrator.Run();

  bool threw = false;
  try {
    orchestrator.Run();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCleanRunRegeneratesEveryRow(PagingStrategy::kKeyset);
  TestCleanRunRegeneratesEveryRow(PagingStrategy::kOffset);
  TestZeroRowsCompletesImmediately();
  TestInterruptAfterPageThreeThenResume();
  TestInterruptBeforeFirstPage();
  TestStaleCheckpointRestartsFromFirstPage();
  TestChangedPageSizeInvalidatesCheckpoint();
  TestCheckpointNeverMovesBackwards();
  TestTransientFailuresAreRetried();
  TestExhaustedRetriesCheckpointLastCommittedPage();
  TestNonTransientFailureIsNotRetried();
  TestMemoryStaysWithinOnePage();
  TestProgressLineIsFinishedBeforeStopping();
  TestTransientFetchFailureIsRetried(PagingStrategy::kKeyset);
  TestTransientFetchFailureIsRetried(PagingStrategy::kOffset);
  TestTransientCommitFailureIsRetried();
  TestExhaustedCommitRetriesStopTheRun();
  TestStopDuringBackoffIsAnInterruption();
  TestPageFailureIsLoggedWithPageFields();
  TestOrchestratorRunsOnce();

  std::cout << "rowsweep_unit_orchestrator: pass\n";
  return 0;
}
