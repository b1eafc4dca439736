#include "internal/config/command_line.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "internal/config/config_loader.hpp"

namespace rowsweep::config {
namespace {

std::uint64_t ParseCount(const std::string& flag, const std::string& value,
                         std::uint64_t max = std::numeric_limits<std::uint64_t>::max()) {
  std::size_t        consumed = 0;
  unsigned long long parsed   = 0;
  try {
    parsed = std::stoull(value, &consumed);
  } catch (const std::out_of_range&) {
    consumed = 0;
  } catch (const std::invalid_argument&) {
    consumed = 0;
  }
  if (consumed != value.size() || value.empty() || value[0] == '-') {
    throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
  }
  if (parsed > max) {
    throw std::invalid_argument(flag + " must be at most " + std::to_string(max) + ", got " + value);
  }
  return parsed;
}

std::uint32_t ParseCount32(const std::string& flag, const std::string& value) {
  return static_cast<std::uint32_t>(ParseCount(flag, value, std::numeric_limits<std::uint32_t>::max()));
}

} // namespace

CommandLine ParseCommandLine(int argc, const char* const* argv) {
  CommandLine args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a value");
      return argv[++i];
    };

    if (arg == "--config") {
      args.config_path = next();
    } else if (arg == "--page-size") {
      args.overrides.mutable_sweep()->set_page_size(ParseCount32(arg, next()));
      args.has_page_size = true;
    } else if (arg == "--checkpoint") {
      args.overrides.mutable_checkpoint()->set_path(next());
      args.has_checkpoint = true;
    } else if (arg == "--paging") {
      const auto value = next();
      if (value == "offset") {
        args.overrides.mutable_sweep()->set_paging(rowsweep::runtime::config::PAGING_STRATEGY_OFFSET);
      } else if (value == "keyset") {
        args.overrides.mutable_sweep()->set_paging(rowsweep::runtime::config::PAGING_STRATEGY_KEYSET);
      } else {
        throw std::invalid_argument("--paging expects offset or keyset, got '" + value + "'");
      }
      args.has_paging = true;
    } else if (arg == "--rows") {
      args.overrides.mutable_seed()->set_rows(ParseCount(arg, next()));
      args.has_rows = true;
    } else if (arg == "--batch-size") {
      args.overrides.mutable_seed()->set_batch_size(ParseCount32(arg, next()));
      args.has_batch_size = true;
    } else if (args.command.empty() && !arg.empty() && arg[0] != '-') {
      args.command = arg;
    } else {
      args.unknown.push_back(arg);
    }
  }
  return args;
}

rowsweep::runtime::config::RuntimeConfig ResolveConfig(const CommandLine& args) {
  auto config = args.config_path.empty() ? ConfigLoader::LoadFromYamlString("")
                                         : ConfigLoader::LoadFromYaml(args.config_path);

  if (args.has_page_size) config.mutable_sweep()->set_page_size(args.overrides.sweep().page_size());
  if (args.has_paging) config.mutable_sweep()->set_paging(args.overrides.sweep().paging());
  if (args.has_checkpoint) config.mutable_checkpoint()->set_path(args.overrides.checkpoint().path());
  if (args.has_rows) config.mutable_seed()->set_rows(args.overrides.seed().rows());
  if (args.has_batch_size) config.mutable_seed()->set_batch_size(args.overrides.seed().batch_size());

  ConfigLoader::Validate(config);
  return config;
}

} // namespace rowsweep::config
