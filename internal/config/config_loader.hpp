#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace rowsweep::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled with defaults, then validated.
*/
class ConfigLoader {
 public:
  static rowsweep::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rowsweep::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fill zero / empty fields with defaults.
  static void ApplyDefaults(rowsweep::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidArgument for values the sweep cannot run with.
  static void Validate(const rowsweep::runtime::config::RuntimeConfig& config);
};

inline constexpr std::uint32_t kDefaultPageSize       = 1000;
inline constexpr std::uint32_t kDefaultMaxAttempts    = 3;
inline constexpr std::uint32_t kDefaultRetryBackoffMs = 100;
inline constexpr std::uint64_t kDefaultSeedRows       = 1000000;
inline constexpr std::uint32_t kDefaultSeedBatchSize  = 1000;
inline constexpr const char*   kDefaultCheckpointPath = "rowsweep.checkpoint";

} // namespace rowsweep::config
