#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using keysync::config::ConfigLoader;
using keysync::util::ConfigError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "keysync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::filesystem::path& path) {
  try {
    (void)ConfigLoader::LoadFromYaml(path.string());
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
remote:
  graphql_endpoint: "https://oryx.example/graphql"
  metadata_url: "https://configure.example/metadata.json"
  user_agent: "keysync-test/1.0"
  connect_timeout_ms: 2500
  request_timeout_ms: 30000
store:
  path: "/var/lib/keymapp/keymapp.sqlite3"
  mkdir: false
  busy_timeout_ms: 750
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.remote().graphql_endpoint() == "https://oryx.example/graphql");
  assert(config.remote().metadata_url() == "https://configure.example/metadata.json");
  assert(config.remote().user_agent() == "keysync-test/1.0");
  assert(config.remote().connect_timeout_ms() == 2500);
  assert(config.remote().request_timeout_ms() == 30000);
  assert(config.store().path() == "/var/lib/keymapp/keymapp.sqlite3");
  assert(!config.store().mkdir());
  assert(config.store().busy_timeout_ms() == 750);
}

void TestMissingSectionsFallBackToDefaults() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(store:
  path: "/tmp/keymapp.sqlite3"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().path() == "/tmp/keymapp.sqlite3");
  assert(config.store().mkdir());
  assert(config.store().busy_timeout_ms() == keysync::config::kDefaultBusyTimeoutMs);
  assert(config.remote().graphql_endpoint() == keysync::config::kDefaultGraphqlEndpoint);
  assert(config.remote().metadata_url() == keysync::config::kDefaultMetadataUrl);
  assert(config.remote().user_agent() == keysync::config::kDefaultUserAgent);
  assert(config.remote().connect_timeout_ms() == keysync::config::kDefaultConnectTimeoutMs);
  assert(config.remote().request_timeout_ms() == keysync::config::kDefaultRequestTimeoutMs);
  assert(config.logging().level().empty());
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().path() == keysync::config::kDefaultStorePath);
  assert(config.remote().graphql_endpoint() == "https://oryx.zsa.io/graphql");
  assert(config.remote().metadata_url() == "https://configure.zsa.io/metadata.json");
}

void TestZeroTimeoutsAreKept() {
  const auto yaml_path = WriteYaml("zero_timeouts",
                                   R"(remote:
  connect_timeout_ms: 0
  request_timeout_ms: 0
store:
  busy_timeout_ms: 0
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.remote().connect_timeout_ms() == 0);
  assert(config.remote().request_timeout_ms() == 0);
  assert(config.store().busy_timeout_ms() == 0);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_scalars",
                                   R"(remote:
  user_agent: "1234"
store:
  path: "C:\\keymapp\\\"quoted\"\\keymapp.sqlite3"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.remote().user_agent() == "1234");
  assert(config.store().path() == "C:\\keymapp\\\"quoted\"\\keymapp.sqlite3");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(remote:
  graphql_endpoint: "https://oryx.example/graphql"
  retries: 3
)");

  assert(Rejects(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingTopLevelIsRejected() {
  assert(Rejects(WriteYaml("sequence", "- one\n- two\n")));
  assert(Rejects(WriteYaml("scalar", "just a string\n")));
}

void TestMissingFileIsRejected() {
  assert(Rejects(std::filesystem::temp_directory_path() / "keysync_config_loader_tests" / "does_not_exist.yaml"));
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestMissingSectionsFallBackToDefaults();
  TestEmptyFileYieldsDefaults();
  TestZeroTimeoutsAreKept();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestNonMappingTopLevelIsRejected();
  TestMissingFileIsRejected();

  std::cout << "keysync_unit_config_loader: pass\n";
  return 0;
}
