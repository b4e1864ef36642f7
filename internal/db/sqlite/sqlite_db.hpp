#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace keysync::db::sqlite {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

struct SqliteOptions {
  // how long to wait on a lock held by the desktop application
  std::uint32_t busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  Opens read-write and creates the file when missing. The parent directory
  must already exist. All failures throw util::StoreError.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  Statement Prepare(const std::string& sql);

  // Throws StoreError naming `what` unless rc is OK/ROW/DONE.
  void Check(int rc, const char* what) const;

 private:
  void Configure(const SqliteOptions& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace keysync::db::sqlite
