#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace keysync::address {

/*
  Identifiers carried by a configurator page address:

    https://configure.zsa.io/<geometry>/layouts/<layout-id>/<revision-id>/...

  Only positions 0, 2 and 3 of the path are meaningful. The first four
  segments must be non-empty; nothing else is validated.
*/
struct LayoutAddress {
  std::string geometry;
  std::string layout_id;
  std::string revision_id;
};

/*
  Parses `address` as a URL and extracts the identifier triple.

  A missing scheme defaults to https.
  Throws util::InvalidAddress when the URL does not parse or when the path
  has fewer than four segments or one of the first four is empty.
*/
LayoutAddress DecodeAddress(const std::string& address);

// Splits a decoded URL path on '/' after trimming leading slashes.
std::vector<std::string> SplitPath(std::string_view path);

} // namespace keysync::address
