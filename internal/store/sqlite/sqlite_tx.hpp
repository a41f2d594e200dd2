#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace outbox::store::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Destructor rolls back if Commit() was never reached.
*/
class SqliteTransaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

}
