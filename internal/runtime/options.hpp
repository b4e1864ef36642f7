#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "config/config.pb.h"

namespace keysync::runtime {

/*
  Parsed command line. Unset optionals fall back to the config file, then to
  built-in defaults.
*/
struct CommandLine {
  std::string                layout;
  std::optional<std::string> store_path;
  std::optional<bool>        mkdir;
  std::optional<std::string> config_path;
  bool                       help = false;
};

/*
  Accepts "--flag value", "--flag=value" and the single-dash forms.
  Throws std::invalid_argument for unknown flags, missing values or stray
  positional arguments. Does not check that --layout is present.
*/
CommandLine ParseCommandLine(int argc, const char* const* argv);

// Overrides config fields with whatever the command line set.
void ApplyCommandLine(const CommandLine& cli, keysync::runtime::config::RuntimeConfig* config);

void PrintUsage(std::ostream& out);

} // namespace keysync::runtime
