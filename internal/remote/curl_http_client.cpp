#include "curl_http_client.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace keysync::remote {

using keysync::util::FetchFailed;

namespace {

struct CurlGlobal {
  CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  }
  ~CurlGlobal() {
    curl_global_cleanup();
  }
};

struct EasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t WriteToString(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(data, size * nmemb);
  return size * nmemb;
}

EasyHandle NewHandle(const std::string& url, const CurlOptions& options, std::string* body, char* error_buffer) {
  EasyHandle curl(curl_easy_init());
  if (!curl) {
    throw FetchFailed("curl_easy_init failed");
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, body);
  if (!options.user_agent.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
  }
  if (options.connect_timeout_ms > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout_ms));
  }
  if (options.request_timeout_ms > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options.request_timeout_ms));
  }
  return curl;
}

HttpResponse Perform(CURL* curl, const char* method, const std::string& url, std::string* body, const char* error_buffer) {
  const CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
    throw FetchFailed(std::string(method) + " " + url + " failed: " + detail);
  }

  HttpResponse response;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  response.body = std::move(*body);

  KEYSYNC_LOG_DEBUG("http response",
                    {observability::StringField("method", method), observability::StringField("url", url),
                     observability::IntField("status", response.status),
                     observability::IntField("bytes", static_cast<std::int64_t>(response.body.size()))});
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient(CurlOptions options) : options_(std::move(options)) {
  static CurlGlobal global;
}

HttpResponse CurlHttpClient::Get(const std::string& url) {
  std::string body;
  char        error_buffer[CURL_ERROR_SIZE] = {};
  auto        curl = NewHandle(url, options_, &body, error_buffer);

  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

  return Perform(curl.get(), "GET", url, &body, error_buffer);
}

HttpResponse CurlHttpClient::Post(const std::string& url, const std::string& content_type, const std::string& payload) {
  std::string body;
  char        error_buffer[CURL_ERROR_SIZE] = {};
  auto        curl = NewHandle(url, options_, &body, error_buffer);

  const std::string content_type_header = "Content-Type: " + content_type;
  HeaderList        headers(curl_slist_append(nullptr, content_type_header.c_str()));
  if (!headers) {
    throw FetchFailed("curl_slist_append failed");
  }

  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.data());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

  return Perform(curl.get(), "POST", url, &body, error_buffer);
}

} // namespace keysync::remote
