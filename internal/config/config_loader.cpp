#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace hacktracker::config {

using hacktracker::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("300s", "2")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

// ------------------------------------------------------------
// Defaults / validation
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* cache = config->mutable_cache();
  if (cache->schema_version() == 0) {
    cache->set_schema_version(kDefaultCacheSchemaVersion);
  }
  if (!cache->has_default_ttl()) {
    cache->mutable_default_ttl()->set_seconds(kDefaultCacheTtlSeconds);
  }

  if (config->storage().backend_case() == hacktracker::runtime::config::StorageConfig::BACKEND_NOT_SET) {
    config->mutable_storage()->mutable_memory();
  }

  if (!config->game_state().has_keep_alive()) {
    config->mutable_game_state()->mutable_keep_alive()->set_seconds(kDefaultKeepAliveSeconds);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.cache().schema_version() < 1) {
    throw std::runtime_error("Invalid configuration: cache.schema_version must be >= 1");
  }
  if (config.cache().default_ttl().seconds() <= 0) {
    throw std::runtime_error("Invalid configuration: cache.default_ttl must be positive");
  }
  if (config.game_state().keep_alive().seconds() < 0) {
    throw std::runtime_error("Invalid configuration: game_state.keep_alive must not be negative");
  }
  if (config.storage().has_sqlite() && config.storage().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: storage.sqlite.path is required");
  }
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
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

  RuntimeConfig config;

  // an empty file is a valid all-defaults config
  if (!yaml.IsNull()) {
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
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

} // namespace hacktracker::config
