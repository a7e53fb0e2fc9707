#include "sqlite_db.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace docrev::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::IOError("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // foreign keys are OFF by default in sqlite; cascade delete depends on them
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS documents (id INTEGER PRIMARY KEY AUTOINCREMENT, filename TEXT NOT NULL UNIQUE, created_at_s INTEGER NOT NULL, last_modified_s INTEGER NOT NULL, author TEXT NOT NULL, last_modified_by TEXT NOT NULL, mode INTEGER NOT NULL DEFAULT 0, title TEXT, subject TEXT, keywords TEXT, comments TEXT, total_edit_time_min INTEGER);",
      "CREATE TABLE IF NOT EXISTS sentences (id INTEGER PRIMARY KEY AUTOINCREMENT, document_id INTEGER NOT NULL, position INTEGER NOT NULL, text TEXT NOT NULL, created_at_s INTEGER NOT NULL, modified_at_s INTEGER NOT NULL, author TEXT NOT NULL, revision_id INTEGER NOT NULL, UNIQUE(document_id, position), FOREIGN KEY(document_id) REFERENCES documents(id) ON DELETE CASCADE);",
      "CREATE INDEX IF NOT EXISTS sentences_by_document ON sentences(document_id, position);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,filename,created_at_s,last_modified_s,author,last_modified_by,mode,title,subject,keywords,comments,total_edit_time_min FROM documents LIMIT 1;");
  db.Exec("SELECT id,document_id,position,text,created_at_s,modified_at_s,author,revision_id FROM sentences LIMIT 1;");
}

} // namespace docrev::db::sqlite
