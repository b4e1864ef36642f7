#pragma once

#include <string>
#include <vector>

namespace keysync::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
  Every statement must be idempotent (IF NOT EXISTS); there is no
  version table, the whole list runs on every open.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// config, metadata, heatmap, revision, smart_layer, auth
const std::vector<std::string>& StoreSchema();

} // namespace keysync::db::sql
