#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/config_record.hpp"
#include "internal/db/model/revision_record.hpp"
#include "sqlite_db.hpp"

namespace keysync::db::sqlite {

/*
  The Keymapp store.

  Every write is idempotent so an interrupted run can simply be repeated:
    - EnsureSchema   creates missing tables only
    - SeedDefaults   inserts missing config keys only
    - InsertMetadata is gated by MetadataCount() in the caller
    - UpsertRevision replaces the data of an existing revision id

  There is no transaction spanning these steps. All failures throw
  util::StoreError.
*/
class SqliteStore {
public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  void EnsureSchema();

  // Returns the number of config rows inserted.
  std::size_t SeedDefaults();

  std::int64_t MetadataCount();
  void InsertMetadata(const std::string& data);
  std::optional<std::string> GetMetadata();

  void UpsertRevision(const model::RevisionRecord& record);
  std::optional<model::RevisionRecord> GetRevision(const std::string& revision_id);
  std::int64_t RevisionCount();

  std::int64_t ConfigKeyCount(const std::string& key);
  std::optional<std::string> GetConfigValue(const std::string& key);
  std::vector<model::ConfigRecord> ListConfig();

private:
  std::int64_t QueryCount(const char* sql, const std::string* key, const char* what);

  std::shared_ptr<SqliteDB> db_;
};

}
