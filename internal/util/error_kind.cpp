#include "error_kind.hpp"

namespace keysync::util {

std::string_view ErrorKind(const std::exception& e) {
  if (dynamic_cast<const InvalidAddress*>(&e)) {
    return "invalid_address";
  }
  if (dynamic_cast<const FetchFailed*>(&e)) {
    return "fetch_failed";
  }
  if (dynamic_cast<const MalformedResponse*>(&e)) {
    return "malformed_response";
  }
  if (dynamic_cast<const StoreError*>(&e)) {
    return "store_error";
  }
  if (dynamic_cast<const ConfigError*>(&e)) {
    return "config_error";
  }

  return "internal";
}

} // namespace keysync::util
