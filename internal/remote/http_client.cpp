#include "http_client.hpp"

#include "internal/util/errors.hpp"

namespace keysync::remote {

void EnsureSuccess(const HttpResponse& response, std::string_view what, const std::string& url) {
  if (response.status >= 400) {
    throw util::FetchFailed("failed to get " + std::string(what) + ": " + url + " returned HTTP " +
                            std::to_string(response.status));
  }
}

} // namespace keysync::remote
