#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace keysync::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - a concurrent writer shows up as busy here, not halfway through

  Everything not committed is rolled back when the object goes away.
*/
class SqliteTransaction final {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
