#include "internal/seed/seeder.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>

#include "internal/db/memory/memory_record_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/ticket_fixtures.hpp"

namespace {

using rowsweep::db::memory::MemoryRecordStore;
using rowsweep::seed::Seeder;

void TestSeedInsertsInBatches() {
  MemoryRecordStore store;
  Seeder            seeder(store);

  auto report = seeder.Seed(2500, 1000);
  assert(report.rows_inserted == 2500);
  assert(report.batches == 3);
  assert(!report.interrupted);

  const auto tickets = rowsweep::testing::Snapshot(store);
  assert(tickets.size() == 2500);
  for (const auto& [id, token] : tickets) {
    assert(id > 0);
    assert(rowsweep::util::IsCanonicalUUID(token));
  }
}

void TestSeedAppendsToExistingRows() {
  MemoryRecordStore store;
  rowsweep::testing::InsertTickets(store, 10);

  Seeder seeder(store);
  seeder.Seed(5, 2);
  assert(rowsweep::testing::Snapshot(store).size() == 15);
}

void TestSeedStopsBetweenBatches() {
  MemoryRecordStore store;
  Seeder            seeder(store);

  int  polls  = 0;
  auto report = seeder.Seed(1000, 100, [&] { return ++polls > 2; });
  assert(report.interrupted);
  assert(report.batches == 2);
  assert(rowsweep::testing::Snapshot(store).size() == 200);
}

void TestSeedRendersProgress() {
  MemoryRecordStore              store;
  std::ostringstream             out;
  rowsweep::sweep::ProgressLine  line(out);
  Seeder                         seeder(store, &line);

  seeder.Seed(400, 200);
  const auto text = out.str();
  assert(text.find("Progress: 50.0%") != std::string::npos);
  assert(text.find("Progress: 100.0%") != std::string::npos);
  assert(text.back() == '\n');
}

void TestZeroBatchSizeRejected() {
  MemoryRecordStore store;
  Seeder            seeder(store);

  bool threw = false;
  try {
    seeder.Seed(10, 0);
  } catch (const rowsweep::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestPurgeRemovesEverything() {
  MemoryRecordStore store;
  Seeder            seeder(store);
  seeder.Seed(321, 100);

  assert(seeder.Purge() == 321);
  assert(rowsweep::testing::Snapshot(store).empty());
  assert(seeder.Purge() == 0);
}

} // namespace

int main() {
  TestSeedInsertsInBatches();
  TestSeedAppendsToExistingRows();
  TestSeedStopsBetweenBatches();
  TestSeedRendersProgress();
  TestZeroBatchSizeRejected();
  TestPurgeRemovesEverything();

  std::cout << "rowsweep_unit_seeder: pass\n";
  return 0;
}
