#include "options.hpp"

#include <stdexcept>
#include <string_view>

#include "internal/config/config_loader.hpp"

namespace keysync::runtime {

namespace {

bool ParseBool(std::string_view flag, std::string_view value) {
  if (value == "true" || value == "1") return true;
  if (value == "false" || value == "0") return false;
  throw std::invalid_argument("invalid boolean value \"" + std::string(value) + "\" for " + std::string(flag));
}

} // namespace

CommandLine ParseCommandLine(int argc, const char* const* argv) {
  CommandLine cli;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.size() < 2 || arg[0] != '-') {
      throw std::invalid_argument("unexpected argument: " + std::string(arg));
    }

    // -flag and --flag are equivalent
    arg.remove_prefix(arg[1] == '-' ? 2 : 1);

    std::string_view           name = arg;
    std::optional<std::string> inline_value;
    if (auto eq = arg.find('='); eq != std::string_view::npos) {
      name         = arg.substr(0, eq);
      inline_value = std::string(arg.substr(eq + 1));
    }

    auto value = [&]() -> std::string {
      if (inline_value) return *inline_value;
      if (i + 1 >= argc) {
        throw std::invalid_argument("flag needs an argument: -" + std::string(name));
      }
      return argv[++i];
    };

    if (name == "layout") {
      cli.layout = value();
    } else if (name == "path") {
      cli.store_path = value();
    } else if (name == "config") {
      cli.config_path = value();
    } else if (name == "mkdir") {
      cli.mkdir = inline_value ? ParseBool("-mkdir", *inline_value) : true;
    } else if (name == "no-mkdir" && !inline_value) {
      cli.mkdir = false;
    } else if ((name == "help" || name == "h") && !inline_value) {
      cli.help = true;
    } else {
      throw std::invalid_argument("flag provided but not defined: -" + std::string(name));
    }
  }

  return cli;
}

void ApplyCommandLine(const CommandLine& cli, keysync::runtime::config::RuntimeConfig* config) {
  auto* store = config->mutable_store();
  if (cli.store_path) {
    store->set_path(*cli.store_path);
  }
  if (cli.mkdir) {
    store->set_mkdir(*cli.mkdir);
  }
  keysync::config::ConfigLoader::ApplyDefaults(config);
}

void PrintUsage(std::ostream& out) {
  out << "Usage:\n"
      << "  keysync --layout <url> [--path <file>] [--mkdir|--no-mkdir] [--config <file.yaml>]\n"
      << "\n"
      << "  --layout <url>    link to the configure.zsa.io page for the layout (required)\n"
      << "  --path <file>     path to the keymapp config database (default " << keysync::config::kDefaultStorePath
      << ")\n"
      << "  --mkdir[=bool]    create the database directory (default true)\n"
      << "  --no-mkdir        same as --mkdir=false\n"
      << "  --config <file>   YAML runtime configuration\n"
      << "  --help            show this message\n";
}

} // namespace keysync::runtime
