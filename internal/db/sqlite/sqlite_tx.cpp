#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace docrev::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  Run("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  // sqlite3_exec never throws; a failed rollback is only reported.
  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    DOCREV_LOG_WARN("sqlite rollback failed", {observability::StringField("db", db_->Path()),
                                               observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Run(const char* statement) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db_->Handle(), statement, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }

  std::string msg = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::IOError("metadata store " + db_->Path() + " is locked by another process: " + msg);
  }
  throw util::IOError(std::string(statement) + " failed on " + db_->Path() + ": " + msg);
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("sqlite transaction already finished");
  }
  Run("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  Run("ROLLBACK;");
}

} // namespace docrev::db::sqlite
