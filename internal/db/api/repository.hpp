#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/sentence_record.hpp"

namespace docrev::db {

/*
  Repository abstraction over the metadata store.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A document and all of its sentences are inserted together
  - Deleting a document deletes its sentences (cascade)
  - Reads return nullopt only when the row is absent; a read the backend
    cannot complete throws util::IOError

  The store is the source of truth for sentence timestamps; packages are
  rebuilt from what it returns.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Documents
  // ---------------------------------------------------------------------

  // Assigns record.id and every sentence id.
  virtual Result InsertDocument(Transaction&, model::DocumentRecord& record) = 0;

  virtual std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t id) = 0;

  virtual std::optional<model::DocumentRecord> GetDocumentByFilename(Transaction&, const std::string& filename) = 0;

  // Documents ordered by id, sentences included.
  virtual std::vector<model::DocumentRecord> ListDocuments(Transaction&) = 0;

  // Updates the document row only (timestamps, authors, properties).
  virtual Result UpdateDocument(Transaction&, const model::DocumentRecord& record) = 0;

  virtual Result DeleteDocument(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Sentences
  // ---------------------------------------------------------------------

  // Matches on (document_id, position); updates timestamps and revision id.
  virtual Result UpdateSentence(Transaction&, int64_t document_id, const model::SentenceRecord& record) = 0;
};

} // namespace docrev::db
