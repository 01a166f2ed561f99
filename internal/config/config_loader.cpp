#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/db/model/collections.hpp"

namespace practicedb::config {

namespace {

constexpr uint64_t kDefaultCacheTtlMs       = 5 * 60 * 1000;
constexpr uint32_t kDefaultSyncLogCapacity  = 1000;
constexpr uint64_t kDefaultSyncIntervalMs   = 5 * 60 * 1000;
constexpr uint64_t kDefaultRequestTimeoutMs = 10 * 1000;
constexpr uint32_t kDefaultMaxPushAttempts  = 5;
constexpr const char* kDefaultKeyFile       = "practicedb.key";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

practicedb::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  practicedb::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

practicedb::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

practicedb::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(practicedb::runtime::config::RuntimeConfig& config) {
  auto* engine = config.mutable_engine();
  if (engine->cache_ttl_ms() == 0) engine->set_cache_ttl_ms(kDefaultCacheTtlMs);
  if (engine->sync_log_capacity() == 0) engine->set_sync_log_capacity(kDefaultSyncLogCapacity);

  auto* sync = config.mutable_sync();
  if (sync->interval_ms() == 0) sync->set_interval_ms(kDefaultSyncIntervalMs);
  if (sync->request_timeout_ms() == 0) sync->set_request_timeout_ms(kDefaultRequestTimeoutMs);
  if (sync->max_push_attempts() == 0) sync->set_max_push_attempts(kDefaultMaxPushAttempts);
  if (sync->conflict_resolution() == practicedb::runtime::config::CONFLICT_RESOLUTION_UNSPECIFIED) {
    sync->set_conflict_resolution(practicedb::runtime::config::NEWEST_WINS);
  }

  if (config.storage().has_sqlite() && config.storage().sqlite().key_prefix().empty()) {
    config.mutable_storage()->mutable_sqlite()->set_key_prefix("practicedb_");
  }

  if (config.storage().has_encryption()) {
    auto* encryption = config.mutable_storage()->mutable_encryption();
    if (encryption->key_file().empty()) encryption->set_key_file(kDefaultKeyFile);
    if (encryption->collections().empty()) {
      for (const auto& name : practicedb::db::SensitiveCollections()) encryption->add_collections(name);
    }
  }
}

} // namespace practicedb::config
