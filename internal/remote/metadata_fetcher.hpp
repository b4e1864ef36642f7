#pragma once

#include <string>

#include "internal/remote/http_client.hpp"

namespace keysync::remote {

/*
  Downloads the configurator metadata document.

  The body is returned exactly as received; it is only ever interpreted by
  the desktop application reading the store.
*/
class MetadataFetcher {
 public:
  MetadataFetcher(HttpClient& client, std::string url);

  // Throws util::FetchFailed on transport error or HTTP status >= 400.
  std::string Fetch();

  const std::string& Url() const {
    return url_;
  }

 private:
  HttpClient& client_;
  std::string url_;
};

} // namespace keysync::remote
