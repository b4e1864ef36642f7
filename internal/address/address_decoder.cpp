#include "address_decoder.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace keysync::address {

using keysync::util::InvalidAddress;

namespace {

struct UrlHandleDeleter {
  void operator()(CURLU* handle) const {
    curl_url_cleanup(handle);
  }
};

using UrlHandle = std::unique_ptr<CURLU, UrlHandleDeleter>;

std::string DecodedPath(const std::string& address) {
  UrlHandle url(curl_url());
  if (!url) {
    throw std::runtime_error("curl_url: allocation failed");
  }

  CURLUcode rc = curl_url_set(url.get(), CURLUPART_URL, address.c_str(), CURLU_DEFAULT_SCHEME | CURLU_NON_SUPPORT_SCHEME);
  if (rc != CURLUE_OK) {
    throw InvalidAddress("failed to parse URL '" + address + "': " + curl_url_strerror(rc));
  }

  char* raw_path = nullptr;
  rc             = curl_url_get(url.get(), CURLUPART_PATH, &raw_path, CURLU_URLDECODE);
  if (rc != CURLUE_OK) {
    throw InvalidAddress("failed to decode path of '" + address + "': " + curl_url_strerror(rc));
  }

  std::string path = raw_path ? raw_path : "";
  curl_free(raw_path);
  return path;
}

} // namespace

std::vector<std::string> SplitPath(std::string_view path) {
  const auto start = path.find_first_not_of('/');
  if (start == std::string_view::npos) {
    return {""};
  }
  path.remove_prefix(start);

  std::vector<std::string> segments;
  for (;;) {
    const auto slash = path.find('/');
    segments.emplace_back(path.substr(0, slash));
    if (slash == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slash + 1);
  }
  return segments;
}

LayoutAddress DecodeAddress(const std::string& address) {
  const auto segments = SplitPath(DecodedPath(address));

  if (segments.size() < 4) {
    throw InvalidAddress("invalid config page: " + address);
  }
  for (size_t i = 0; i < 4; ++i) {
    if (segments[i].empty()) {
      throw InvalidAddress("invalid config page: " + address + " (empty path segment " + std::to_string(i) + ")");
    }
  }

  LayoutAddress out;
  out.geometry    = segments[0];
  out.layout_id   = segments[2];
  out.revision_id = segments[3];
  return out;
}

} // namespace keysync::address
