#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace docrev::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDocument(Transaction&, model::DocumentRecord&) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t) override;
  std::optional<model::DocumentRecord> GetDocumentByFilename(Transaction&, const std::string&) override;
  std::vector<model::DocumentRecord> ListDocuments(Transaction&) override;
  Result UpdateDocument(Transaction&, const model::DocumentRecord&) override;
  Result DeleteDocument(Transaction&, int64_t) override;

  Result UpdateSentence(Transaction&, int64_t document_id, const model::SentenceRecord&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
