#pragma once

#include <filesystem>
#include <string>

namespace keysync::util {

/*
  Resolves the user's home directory.

  $HOME wins; otherwise the password database entry for the current uid.
  Throws ConfigError if neither is available.
*/
std::filesystem::path HomeDirectory();

// Replaces a leading "~/" (or a bare "~") with HomeDirectory().
std::filesystem::path ExpandHome(const std::string& path);

/*
  Creates the parent directory of `file` (and its ancestors) with 0750.
  Existing directories are left untouched.
*/
void EnsureParentDirectory(const std::filesystem::path& file);

} // namespace keysync::util
