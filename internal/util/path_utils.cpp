#include "path_utils.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <system_error>

#include "internal/util/errors.hpp"

namespace keysync::util {

std::filesystem::path HomeDirectory() {
  if (const char* home = std::getenv("HOME"); home && *home) {
    return home;
  }

  if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir && *pw->pw_dir) {
    return pw->pw_dir;
  }

  throw ConfigError("unable to determine home directory");
}

std::filesystem::path ExpandHome(const std::string& path) {
  if (path == "~") {
    return HomeDirectory();
  }
  if (path.rfind("~/", 0) == 0) {
    return HomeDirectory() / path.substr(2);
  }
  return path;
}

void EnsureParentDirectory(const std::filesystem::path& file) {
  const auto dir = file.parent_path();
  if (dir.empty()) {
    return;
  }

  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return;
  }

  // walk down from the first missing ancestor so every created level gets 0750
  std::filesystem::path current;
  for (const auto& part : dir) {
    current /= part;
    if (std::filesystem::exists(current, ec)) {
      continue;
    }
    if (!std::filesystem::create_directory(current, ec) && ec) {
      throw StoreError("unable to create directory " + current.string() + ": " + ec.message());
    }
    std::filesystem::permissions(current, std::filesystem::perms(0750), std::filesystem::perm_options::replace, ec);
    if (ec) {
      throw StoreError("unable to set permissions on " + current.string() + ": " + ec.message());
    }
  }

  if (!std::filesystem::is_directory(dir, ec)) {
    throw StoreError("not a directory: " + dir.string());
  }
}

} // namespace keysync::util
