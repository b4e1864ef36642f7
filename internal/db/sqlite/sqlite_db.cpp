#include "sqlite_db.hpp"

#include <algorithm>
#include <limits>

#include "internal/util/errors.hpp"

namespace keysync::db::sqlite {

using keysync::util::StoreError;

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("failed to open db " + path_ + ": " + msg);
  }

  try {
    Configure(options);
  } catch (const StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Check(int rc, const char* what) const {
  if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) {
    return;
  }
  throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db_) + " (" + sqlite3_errstr(rc) + ")");
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw StoreError("sqlite exec failed: " + msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  Statement     owned(stmt);
  Check(rc, "sqlite prepare");
  return owned;
}

void SqliteDB::Configure(const SqliteOptions& options) {
  // journal mode is left alone: the file belongs to the desktop application

  // wait for locks instead of failing immediately; sqlite takes an int
  const auto busy_ms = std::min<std::uint32_t>(options.busy_timeout_ms, std::numeric_limits<int>::max());
  Check(sqlite3_busy_timeout(db_, static_cast<int>(busy_ms)), "busy_timeout");
}

} // namespace keysync::db::sqlite
