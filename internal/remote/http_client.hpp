#pragma once

#include <string>
#include <string_view>

namespace keysync::remote {

struct HttpResponse {
  long        status = 0;
  std::string body;
};

/*
  Blocking HTTP transport.

  Implementations:
    CurlHttpClient → libcurl easy handles
    tests          → FakeHttpClient (canned responses, call log)

  Transport failures throw util::FetchFailed. A response with any status is
  returned as-is; callers decide what status is acceptable.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Get(const std::string& url) = 0;

  virtual HttpResponse Post(const std::string& url, const std::string& content_type, const std::string& body) = 0;
};

/*
  Throws util::FetchFailed for HTTP status >= 400.
  `what` names the request in the error message.
*/
void EnsureSuccess(const HttpResponse& response, std::string_view what, const std::string& url);

} // namespace keysync::remote
