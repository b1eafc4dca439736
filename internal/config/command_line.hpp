#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"

namespace rowsweep::config {

/*
  rowsweep [--config F] <regenerate|seed|purge> [flags]

  Flag values land in `overrides`; the has_* bits say which of them the
  user actually passed. Malformed or out-of-range values throw
  std::invalid_argument.
*/
struct CommandLine {
  std::string                              command;
  std::string                              config_path;
  std::vector<std::string>                 unknown;
  rowsweep::runtime::config::RuntimeConfig overrides;
  bool                                     has_page_size  = false;
  bool                                     has_checkpoint = false;
  bool                                     has_paging     = false;
  bool                                     has_rows       = false;
  bool                                     has_batch_size = false;
};

CommandLine ParseCommandLine(int argc, const char* const* argv);

// Loads --config (or the defaults), applies the flags on top and validates.
rowsweep::runtime::config::RuntimeConfig ResolveConfig(const CommandLine& args);

} // namespace rowsweep::config
