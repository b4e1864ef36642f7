#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/options.hpp"
#include "internal/util/path_utils.hpp"

using keysync::observability::BoolField;
using keysync::observability::IntField;
using keysync::observability::StringField;

int main(int argc, char** argv) {
  keysync::runtime::CommandLine cli;
  try {
    cli = keysync::runtime::ParseCommandLine(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    keysync::runtime::PrintUsage(std::cerr);
    return 2;
  }

  if (cli.help) {
    keysync::runtime::PrintUsage(std::cout);
    return 0;
  }
  if (cli.layout.empty()) {
    keysync::runtime::PrintUsage(std::cerr);
    return 2;
  }

  keysync::observability::InitializeLogging();

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = cli.config_path ? keysync::config::ConfigLoader::LoadFromYaml(*cli.config_path)
                                  : keysync::config::ConfigLoader::Defaults();
    keysync::runtime::ApplyCommandLine(cli, &config);

    keysync::observability::ConfigureLogging(config.logging());

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = keysync::factory::Build(config);

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    const auto store_path = keysync::util::ExpandHome(config.store().path());
    const auto report     = app.synchronizer->Run(cli.layout, store_path);

    KEYSYNC_LOG_INFO("sync complete", {StringField("store", store_path.string()),
                                       StringField("revision", report.revision_id),
                                       IntField("config_rows_seeded", static_cast<std::int64_t>(report.config_rows_seeded)),
                                       BoolField("metadata_fetched", report.metadata_fetched)});

    keysync::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    keysync::observability::LogFailure("sync failed", e);
    keysync::observability::ShutdownLogging();
    return 1;
  }

  return 0;
}
