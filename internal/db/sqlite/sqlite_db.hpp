#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace docrev::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

 private:
  // Configure PRAGMAs (journal mode, foreign keys, busy timeout)
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Creates the documents / sentences tables when missing.
  sentences cascade-delete with their document.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace docrev::db::sqlite
