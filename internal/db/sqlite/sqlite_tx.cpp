#include "sqlite_tx.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace keysync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) {
    return;
  }
  // not Exec(): destructors must not throw
  const int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    KEYSYNC_LOG_WARN("rollback failed", {observability::StringField("error", sqlite3_errstr(rc))});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

} // namespace keysync::db::sqlite
