#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace rowsweep::config {

using rowsweep::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    ConfigLoader::Validate(config);
    return config;
  }

  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a map");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (database->backend_case() == rowsweep::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(4);
  }

  auto* sweep = config.mutable_sweep();
  if (sweep->page_size() == 0) sweep->set_page_size(kDefaultPageSize);
  if (sweep->paging() == rowsweep::runtime::config::PAGING_STRATEGY_UNSPECIFIED) {
    sweep->set_paging(rowsweep::runtime::config::PAGING_STRATEGY_KEYSET);
  }
  if (sweep->max_attempts() == 0) sweep->set_max_attempts(kDefaultMaxAttempts);
  if (sweep->retry_backoff_ms() == 0) sweep->set_retry_backoff_ms(kDefaultRetryBackoffMs);
  if (!sweep->has_show_progress()) sweep->set_show_progress(true);

  auto* checkpoint = config.mutable_checkpoint();
  if (checkpoint->path().empty()) checkpoint->set_path(kDefaultCheckpointPath);

  auto* seed = config.mutable_seed();
  if (seed->rows() == 0) seed->set_rows(kDefaultSeedRows);
  if (seed->batch_size() == 0) seed->set_batch_size(kDefaultSeedBatchSize);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.sweep().page_size() == 0) {
    throw util::InvalidArgument("sweep.page_size must be greater than zero");
  }
  if (config.seed().batch_size() == 0) {
    throw util::InvalidArgument("seed.batch_size must be greater than zero");
  }
  if (config.checkpoint().path().empty()) {
    throw util::InvalidArgument("checkpoint.path must not be empty");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::InvalidArgument("database.sqlite.path must not be empty");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw util::InvalidArgument("database.postgres.connection_uri must not be empty");
  }
}

} // namespace rowsweep::config
