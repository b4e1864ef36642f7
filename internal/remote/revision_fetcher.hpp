#pragma once

#include <string>

#include "internal/address/address_decoder.hpp"
#include "internal/remote/http_client.hpp"

namespace keysync::remote {

struct RevisionPayload {
  // canonical id reported by the service (not necessarily the one in the address)
  std::string revision_id;

  // the response "Data" object, verbatim
  std::string data;
};

/*
  Fetches full layout/revision/tour details for one address from the
  configurator GraphQL endpoint.
*/
class RevisionFetcher {
 public:
  RevisionFetcher(HttpClient& client, std::string endpoint);

  // Throws util::FetchFailed or util::MalformedResponse.
  RevisionPayload Fetch(const address::LayoutAddress& address);

  const std::string& Endpoint() const {
    return endpoint_;
  }

 private:
  HttpClient& client_;
  std::string endpoint_;
};

// JSON request body for the getLayout operation.
std::string BuildLayoutQuery(const address::LayoutAddress& address);

/*
  Two-stage partial decode of a getLayout response:
    1. the body must be a JSON object; its "Data" member is kept as raw text
    2. layout.revision.hashId is read from that text, all else ignored

  Every key on that path follows util::FindTopLevelMember: exact match
  first, then ignoring ASCII case, last duplicate wins. Both documents are
  parsed strictly but nesting depth is not restricted in practice.

  Throws util::MalformedResponse.
*/
RevisionPayload ParseRevisionResponse(const std::string& body);

} // namespace keysync::remote
