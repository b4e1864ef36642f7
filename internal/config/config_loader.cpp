#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace keysync::config {

using keysync::runtime::config::RuntimeConfig;
using keysync::util::ConfigError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
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
      throw ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty file is a valid, all-defaults config
  if (yaml.IsNull()) {
    ApplyDefaults(&config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw ConfigError("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* remote = config->mutable_remote();
  if (remote->graphql_endpoint().empty()) {
    remote->set_graphql_endpoint(kDefaultGraphqlEndpoint);
  }
  if (remote->metadata_url().empty()) {
    remote->set_metadata_url(kDefaultMetadataUrl);
  }
  if (remote->user_agent().empty()) {
    remote->set_user_agent(kDefaultUserAgent);
  }
  if (!remote->has_connect_timeout_ms()) {
    remote->set_connect_timeout_ms(kDefaultConnectTimeoutMs);
  }
  if (!remote->has_request_timeout_ms()) {
    remote->set_request_timeout_ms(kDefaultRequestTimeoutMs);
  }

  auto* store = config->mutable_store();
  if (store->path().empty()) {
    store->set_path(kDefaultStorePath);
  }
  if (!store->has_mkdir()) {
    store->set_mkdir(true);
  }
  if (!store->has_busy_timeout_ms()) {
    store->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  }
}

} // namespace keysync::config
