#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace docrev::db::sqlite {

/*
  SQLite transaction wrapper.

  BEGIN IMMEDIATE takes the write lock up front, so an edit reads the
  sentence set and writes it back without another writer slipping in.
  A second docrev process waits up to the busy timeout, then fails with
  util::IOError.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  // BEGIN / COMMIT / ROLLBACK with failures reported as util::IOError.
  void Run(const char* statement);

  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_ = false;
};

}
