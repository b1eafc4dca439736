#pragma once

#include <cstdint>

#include "internal/db/api/record_store.hpp"
#include "internal/sweep/progress_line.hpp"
#include "internal/sweep/run_state.hpp"

namespace rowsweep::seed {

struct SeedReport {
  std::uint64_t rows_inserted   = 0;
  std::uint64_t batches         = 0;
  bool          interrupted     = false;
  double        elapsed_seconds = 0.0;
};

/*
  Fixture helpers for the ticket table.

  Seed() inserts in fixed-size batches, one transaction per batch, so
  memory stays bounded by the batch size. Write failures throw
  util::StoreError; batches committed before the failure stay.
*/
class Seeder {
 public:
  explicit Seeder(db::RecordStore& store, sweep::ProgressLine* progress = nullptr);

  SeedReport Seed(std::uint64_t rows, std::uint64_t batch_size, const sweep::StopToken& stop_requested = {});

  // Deletes every ticket; returns how many there were.
  std::uint64_t Purge();

 private:
  db::RecordStore&     store_;
  sweep::ProgressLine* progress_;
};

} // namespace rowsweep::seed
