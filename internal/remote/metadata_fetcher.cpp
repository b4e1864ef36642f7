#include "metadata_fetcher.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace keysync::remote {

MetadataFetcher::MetadataFetcher(HttpClient& client, std::string url) : client_(client), url_(std::move(url)) {
}

std::string MetadataFetcher::Fetch() {
  KEYSYNC_LOG_DEBUG("requesting metadata", {observability::StringField("url", url_)});

  auto response = client_.Get(url_);
  EnsureSuccess(response, "metadata", url_);
  return std::move(response.body);
}

} // namespace keysync::remote
