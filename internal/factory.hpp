#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/record_store.hpp"
#include "internal/sweep/checkpoint_store.hpp"
#include "internal/sweep/orchestrator.hpp"

namespace rowsweep::factory {

/*
  Application

  Owns the long-lived objects of one CLI invocation.
*/
struct Application {
  std::shared_ptr<db::RecordStore>        store;
  std::unique_ptr<sweep::CheckpointStore> checkpoints;
  sweep::SweepOptions                     sweep_options;
};

/*
  Build

  Constructs the record store, checkpoint store and sweep options from
  the runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
Application Build(const rowsweep::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::RecordStore> BuildRecordStore(const rowsweep::runtime::config::RuntimeConfig& config);

sweep::SweepOptions BuildSweepOptions(const rowsweep::runtime::config::RuntimeConfig& config);

} // namespace rowsweep::factory
