#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "internal/config/command_line.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/seed/seeder.hpp"
#include "internal/sweep/orchestrator.hpp"
#include "internal/sweep/progress_line.hpp"

using rowsweep::observability::DoubleField;
using rowsweep::observability::StringField;
using rowsweep::observability::UintField;

namespace {

constexpr int kExitOk          = 0;
constexpr int kExitUsage       = 1;
constexpr int kExitFatal       = 2;
constexpr int kExitPageFailed  = 3;
constexpr int kExitInterrupted = 130;

volatile std::sig_atomic_t g_stop_requested = 0;

void HandleSignal(int) {
  g_stop_requested = 1;
}

bool StopRequested() {
  return g_stop_requested != 0;
}

void Usage() {
  std::cerr << "Usage:\n"
            << "  rowsweep [--config <config.yaml>] regenerate [--page-size N] [--checkpoint PATH] "
               "[--paging offset|keyset]\n"
            << "  rowsweep [--config <config.yaml>] seed [--rows N] [--batch-size N]\n"
            << "  rowsweep [--config <config.yaml>] purge\n";
}

int RunRegenerate(const rowsweep::runtime::config::RuntimeConfig& config, rowsweep::factory::Application& app) {
  rowsweep::sweep::ProgressLine progress(std::cout, config.sweep().show_progress());
  rowsweep::sweep::Orchestrator orchestrator(*app.store, *app.checkpoints, app.sweep_options, &progress);

  const auto report = orchestrator.Run(StopRequested);

  ROWSWEEP_LOG_INFO("regenerate finished",
                    {StringField("state", rowsweep::sweep::ToString(report.final_state)),
                     StringField("cause", rowsweep::sweep::ToString(report.cause)),
                     UintField("first_page", report.first_page),
                     UintField("last_committed_page", report.last_committed_page),
                     UintField("total_pages", report.total_pages),
                     UintField("rows_committed", report.rows_committed), UintField("retries", report.retries),
                     DoubleField("elapsed_seconds", report.elapsed_seconds)});
  std::cout << fmt::format("Took: {:.4f} sec", report.elapsed_seconds) << std::endl;

  switch (report.cause) {
    case rowsweep::sweep::StopCause::kNone:
      return kExitOk;
    case rowsweep::sweep::StopCause::kInterrupted:
      std::cerr << "interrupted after page " << report.last_committed_page << " of " << report.total_pages
                << "; rerun to resume from " << app.checkpoints->Location() << "\n";
      return kExitInterrupted;
    case rowsweep::sweep::StopCause::kFailed:
      std::cerr << "error: " << report.error << " (" << report.last_committed_page << " of " << report.total_pages
                << " pages committed; rerun to resume from " << app.checkpoints->Location() << ")\n";
      return kExitPageFailed;
  }
  return kExitFatal;
}

int RunSeed(const rowsweep::runtime::config::RuntimeConfig& config, rowsweep::factory::Application& app) {
  rowsweep::sweep::ProgressLine progress(std::cout, config.sweep().show_progress());
  rowsweep::seed::Seeder        seeder(*app.store, &progress);

  const auto report = seeder.Seed(config.seed().rows(), config.seed().batch_size(), StopRequested);
  std::cout << fmt::format("Took: {:.4f} sec", report.elapsed_seconds) << std::endl;
  return report.interrupted ? kExitInterrupted : kExitOk;
}

int RunPurge(rowsweep::factory::Application& app) {
  rowsweep::seed::Seeder seeder(*app.store);
  const auto             deleted = seeder.Purge();
  std::cout << "Deleted " << deleted << " tickets" << std::endl;
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  rowsweep::config::CommandLine args;
  try {
    args = rowsweep::config::ParseCommandLine(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return kExitUsage;
  }

  if (args.command.empty() || !args.unknown.empty() ||
      (args.command != "regenerate" && args.command != "seed" && args.command != "purge")) {
    Usage();
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = rowsweep::config::ResolveConfig(args);
    rowsweep::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = rowsweep::factory::Build(config);

    // Register signal handlers before any page work starts.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int rc = kExitOk;
    if (args.command == "regenerate") {
      rc = RunRegenerate(config, app);
    } else if (args.command == "seed") {
      rc = RunSeed(config, app);
    } else {
      rc = RunPurge(app);
    }

    rowsweep::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    ROWSWEEP_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    rowsweep::observability::ShutdownLogging();
    return kExitFatal;
  }
}
