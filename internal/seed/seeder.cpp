#include "internal/seed/seeder.hpp"

#include <algorithm>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/sweep/progress_estimator.hpp"
#include "internal/sweep/token_mutator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rowsweep::seed {

using observability::UintField;

Seeder::Seeder(db::RecordStore& store, sweep::ProgressLine* progress) : store_(store), progress_(progress) {
}

SeedReport Seeder::Seed(std::uint64_t rows, std::uint64_t batch_size, const sweep::StopToken& stop_requested) {
  if (batch_size == 0) {
    throw util::InvalidArgument("batch size must be greater than zero");
  }

  const auto started = util::SteadyClock::now();
  SeedReport report;

  sweep::ProgressEstimator estimator(rows, batch_size);
  std::vector<db::model::TicketRecord> batch;
  batch.reserve(static_cast<std::size_t>(std::min(rows, batch_size)));

  while (report.rows_inserted < rows) {
    if (stop_requested && stop_requested()) {
      report.interrupted = true;
      break;
    }

    const auto batch_started = util::SteadyClock::now();
    const auto count         = std::min(batch_size, rows - report.rows_inserted);

    batch.clear();
    for (std::uint64_t i = 0; i < count; ++i) {
      batch.push_back({0, sweep::TokenMutator::NewToken()});
    }

    auto tx     = store_.Begin();
    auto result = store_.InsertRecords(*tx, batch);
    if (!result) {
      if (progress_) progress_->Finish();
      throw util::StoreError(result.code, "insert batch " + std::to_string(report.batches + 1) + ": " + result.message);
    }
    tx->Commit();

    report.rows_inserted += count;
    ++report.batches;

    const auto snapshot = estimator.Update(
        report.rows_inserted, std::chrono::duration<double>(util::SteadyClock::now() - batch_started));
    if (progress_) progress_->Render(snapshot);
  }

  if (progress_) progress_->Finish();

  report.elapsed_seconds = util::SecondsSince(started);
  ROWSWEEP_LOG_INFO("seed finished", {UintField("rows", report.rows_inserted), UintField("batches", report.batches),
                                      observability::BoolField("interrupted", report.interrupted)});
  return report;
}

std::uint64_t Seeder::Purge() {
  auto       tx    = store_.Begin();
  const auto count = store_.CountRecords(*tx);

  auto result = store_.DeleteAll(*tx);
  if (!result) {
    throw util::StoreError(result.code, "purge: " + result.message);
  }
  tx->Commit();

  ROWSWEEP_LOG_INFO("purge finished", {UintField("rows", count)});
  return count;
}

} // namespace rowsweep::seed
