#include "migrations.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace keysync::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

const std::vector<std::string>& StoreSchema() {
  static const std::vector<std::string> schema = {
      CREATE_CONFIG, CREATE_METADATA, CREATE_HEATMAP, CREATE_REVISION, CREATE_SMART_LAYER, CREATE_AUTH,
  };
  return schema;
}

} // namespace keysync::db::sql
