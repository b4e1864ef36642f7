#pragma once

#include <cstdint>
#include <string>

#include "internal/remote/http_client.hpp"

namespace keysync::remote {

struct CurlOptions {
  std::string user_agent;

  // 0 = no bound
  std::uint32_t connect_timeout_ms = 0;
  std::uint32_t request_timeout_ms = 0;
};

/*
  libcurl transport.

  One easy handle per request; redirects are followed. curl_global_init runs
  once per process on first construction.
*/
class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(CurlOptions options);

  CurlHttpClient(const CurlHttpClient&)            = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse Get(const std::string& url) override;

  HttpResponse Post(const std::string& url, const std::string& content_type, const std::string& body) override;

 private:
  CurlOptions options_;
};

} // namespace keysync::remote
