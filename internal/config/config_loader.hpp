#pragma once

#include <string>

#include "config/config.pb.h"

namespace keysync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static keysync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static keysync::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(keysync::runtime::config::RuntimeConfig* config);
};

inline constexpr const char* kDefaultGraphqlEndpoint = "https://oryx.zsa.io/graphql";
inline constexpr const char* kDefaultMetadataUrl     = "https://configure.zsa.io/metadata.json";
inline constexpr const char* kDefaultStorePath       = "~/.config/.keymapp/keymapp.sqlite3";
inline constexpr const char* kDefaultUserAgent       = "keysync";

inline constexpr unsigned kDefaultConnectTimeoutMs = 10000;
inline constexpr unsigned kDefaultRequestTimeoutMs = 60000;
inline constexpr unsigned kDefaultBusyTimeoutMs    = 5000;

} // namespace keysync::config
