#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "internal/address/address_decoder.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/remote/http_client.hpp"

namespace keysync::sync {

struct SyncOptions {
  std::string graphql_endpoint;
  std::string metadata_url;

  // create the store's parent directory before opening it
  bool create_parent_directories = true;

  db::sqlite::SqliteOptions store;
};

struct SyncReport {
  address::LayoutAddress address;

  // canonical id the revision row is keyed on
  std::string revision_id;

  std::size_t config_rows_seeded = 0;
  bool        metadata_fetched   = false;
  std::size_t metadata_bytes     = 0;
  std::size_t revision_bytes     = 0;
};

/*
  One synchronization run:

    decode address
      → fetch revision                  (POST graphql)
      → open store, schema, seed config
      → fetch metadata iff table empty  (GET metadata.json)
      → upsert revision row

  Any failure aborts the run with the exception of the failing step. The
  store connection is closed on every path.
*/
class Synchronizer {
 public:
  Synchronizer(remote::HttpClient& client, SyncOptions options);

  SyncReport Run(const std::string& address, const std::filesystem::path& store_path);

 private:
  remote::HttpClient& client_;
  SyncOptions         options_;
};

} // namespace keysync::sync
