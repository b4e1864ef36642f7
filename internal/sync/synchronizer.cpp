#include "synchronizer.hpp"

#include <memory>

#include "internal/db/sqlite/sqlite_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/metadata_fetcher.hpp"
#include "internal/remote/revision_fetcher.hpp"
#include "internal/util/path_utils.hpp"

namespace keysync::sync {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

Synchronizer::Synchronizer(remote::HttpClient& client, SyncOptions options)
    : client_(client), options_(std::move(options)) {
}

SyncReport Synchronizer::Run(const std::string& address, const std::filesystem::path& store_path) {
  SyncReport report;

  report.address = address::DecodeAddress(address);
  KEYSYNC_LOG_INFO("decoded layout address", {StringField("geometry", report.address.geometry),
                                              StringField("layout", report.address.layout_id),
                                              StringField("revision", report.address.revision_id)});

  remote::RevisionFetcher revisions(client_, options_.graphql_endpoint);
  auto                    revision = revisions.Fetch(report.address);
  report.revision_id    = revision.revision_id;
  report.revision_bytes = revision.data.size();
  KEYSYNC_LOG_INFO("fetched revision", {StringField("revision", revision.revision_id),
                                        IntField("bytes", static_cast<std::int64_t>(revision.data.size()))});

  if (options_.create_parent_directories) {
    util::EnsureParentDirectory(store_path);
  }

  auto                     db = std::make_shared<db::sqlite::SqliteDB>(store_path.string(), options_.store);
  db::sqlite::SqliteStore store(db);

  store.EnsureSchema();
  report.config_rows_seeded = store.SeedDefaults();
  KEYSYNC_LOG_INFO("store ready", {StringField("path", store_path.string()),
                                   IntField("config_rows_seeded", static_cast<std::int64_t>(report.config_rows_seeded))});

  if (store.MetadataCount() == 0) {
    remote::MetadataFetcher metadata(client_, options_.metadata_url);
    const auto              blob = metadata.Fetch();
    store.InsertMetadata(blob);
    report.metadata_fetched = true;
    report.metadata_bytes   = blob.size();
    KEYSYNC_LOG_INFO("stored metadata", {IntField("bytes", static_cast<std::int64_t>(blob.size()))});
  } else {
    KEYSYNC_LOG_DEBUG("metadata already present, skipping fetch");
  }

  store.UpsertRevision({revision.revision_id, std::move(revision.data)});
  KEYSYNC_LOG_INFO("stored revision", {StringField("revision", report.revision_id),
                                       BoolField("metadata_fetched", report.metadata_fetched)});

  return report;
}

} // namespace keysync::sync
