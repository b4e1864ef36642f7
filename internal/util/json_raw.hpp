#pragma once

#include <optional>
#include <string_view>

namespace keysync::util {

/*
  Returns the value text of member `key` of the top-level JSON object,
  byte-for-byte as it appears in `json` (a view into `json`).

  An exact key match wins; otherwise a key equal to `key` ignoring ASCII
  case is used. Among duplicates the last one wins. Keys are compared after decoding their escape
  sequences.

  Intended for documents that already passed a full JSON parse: malformed
  input yields std::nullopt, never an exception.
*/
std::optional<std::string_view> FindTopLevelMember(std::string_view json, std::string_view key);

// Equality ignoring ASCII case only.
bool EqualFoldAscii(std::string_view a, std::string_view b);

} // namespace keysync::util
