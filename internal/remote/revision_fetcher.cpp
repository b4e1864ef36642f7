#include "revision_fetcher.hpp"

#include <google/protobuf/util/json_util.h>
#include <json/json.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_raw.hpp"
#include "keysync/remote/v1/layout.pb.h"

namespace keysync::remote {

using keysync::util::MalformedResponse;

namespace {

constexpr const char* kOperationName = "getLayout";

constexpr const char* kLayoutQueryDocument = R"GQL(
query getLayout($hashId: String!, $revisionId: String!, $geometry: String) {
	layout(hashId: $hashId, geometry: $geometry, revisionId: $revisionId) {
		...LayoutData
	}
}
fragment LayoutData on Layout {
	privacy
	geometry
	hashId
	parent {
		hashId
	}
	tags {
		id
		hashId
		name
	}
	title
	user {
		annotation
		annotationPublic
		name
		hashId
		pictureUrl
	}
	isDefault
	revision {
		...RevisionData
	}
	lastRevisionCompiled
	isLatestRevision
}
fragment RevisionData on Revision {
	createdAt
	hashId
	model
	title
	config
	swatch
	qmkVersion
	qmkUptodate
	hasDeletedLayers
	md5
	combos {
		keyIndices
		layerIdx
		name
		trigger
	}
	tour {
		...TourData
	}
	layers {
		builtIn
		hashId
		keys
		position
		title
		color
		prevHashId
	}
}
fragment TourData on Tour {
	hashId url steps: tourSteps {
		hashId intro outro position content keyIndex layer {
			hashId position
		}
	}
}
)GQL";

// Deep enough for any layout document; guards the recursive reader only.
constexpr int kJsonStackLimit = 10000;

Json::Value ParseJson(std::string_view text, const std::string& what) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  builder["rejectDupKeys"] = false;
  builder["stackLimit"]    = kJsonStackLimit;

  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  try {
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
      throw MalformedResponse(what + ": " + errors);
    }
  } catch (const Json::Exception& e) {
    throw MalformedResponse(what + ": " + e.what());
  }
  return root;
}

// Member `key` of `object`: an exact match first, then a key equal to it
// ignoring ASCII case. Used for diagnostics only.
const Json::Value* FindMember(const Json::Value& object, std::string_view key) {
  if (!object.isObject()) {
    return nullptr;
  }
  if (const Json::Value* exact = object.find(key.data(), key.data() + key.size())) {
    return exact;
  }
  for (auto it = object.begin(); it != object.end(); ++it) {
    if (util::EqualFoldAscii(it.name(), key)) {
      return &*it;
    }
  }
  return nullptr;
}

// First GraphQL error message of a response, if it carries any.
std::string FirstGraphqlError(const Json::Value& root) {
  const Json::Value* errors = FindMember(root, "errors");
  if (!errors || !errors->isArray()) {
    return {};
  }
  for (const auto& error : *errors) {
    const Json::Value* message = FindMember(error, "message");
    if (message && message->isString()) {
      return message->asString();
    }
  }
  return {};
}

} // namespace

std::string BuildLayoutQuery(const address::LayoutAddress& address) {
  keysync::remote::v1::LayoutQueryRequest request;
  request.set_operation_name(kOperationName);
  auto* variables = request.mutable_variables();
  variables->set_hash_id(address.layout_id);
  variables->set_geometry(address.geometry);
  variables->set_revision_id(address.revision_id);
  request.set_query(kLayoutQueryDocument);

  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(request, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to marshal query: " + std::string(status.message()));
  }
  return json;
}

RevisionPayload ParseRevisionResponse(const std::string& body) {
  const Json::Value root = ParseJson(body, "failed to parse revision data");
  if (!root.isObject()) {
    throw MalformedResponse("failed to parse revision data: top level is not an object");
  }

  const auto data = util::FindTopLevelMember(body, "Data");
  if (!data || *data == "null") {
    std::string msg = "revision response has no Data";
    if (auto error = FirstGraphqlError(root); !error.empty()) {
      msg += ": " + error;
    }
    throw MalformedResponse(msg);
  }

  // read the id from the exact bytes that get stored, with the same key rule as Data
  (void)ParseJson(*data, "failed to parse revision ID");

  std::optional<std::string_view> hash_text;
  if (const auto layout = util::FindTopLevelMember(*data, "layout")) {
    if (const auto revision = util::FindTopLevelMember(*layout, "revision")) {
      hash_text = util::FindTopLevelMember(*revision, "hashId");
    }
  }
  Json::Value hash_id;
  if (hash_text) {
    hash_id = ParseJson("[" + std::string(*hash_text) + "]", "failed to parse revision ID")[0];
  }
  if (!hash_id.isString() || hash_id.asString().empty()) {
    throw MalformedResponse("revision response has no layout.revision.hashId");
  }

  RevisionPayload out;
  out.revision_id = hash_id.asString();
  out.data.assign(data->data(), data->size());
  return out;
}

RevisionFetcher::RevisionFetcher(HttpClient& client, std::string endpoint)
    : client_(client), endpoint_(std::move(endpoint)) {
}

RevisionPayload RevisionFetcher::Fetch(const address::LayoutAddress& address) {
  const auto query = BuildLayoutQuery(address);

  KEYSYNC_LOG_DEBUG("requesting revision",
                    {observability::StringField("endpoint", endpoint_),
                     observability::StringField("geometry", address.geometry),
                     observability::StringField("layout", address.layout_id),
                     observability::StringField("revision", address.revision_id)});

  auto response = client_.Post(endpoint_, "application/json", query);
  EnsureSuccess(response, "revision data", endpoint_);

  return ParseRevisionResponse(response.body);
}

} // namespace keysync::remote
