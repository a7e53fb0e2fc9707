#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace docrev::db::memory {

class MemoryTransaction;

/*
  In-process repository. Used when no sqlite path is configured and by
  tests. Transactions work on a snapshot copy and publish it on commit.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDocument(Transaction&, model::DocumentRecord&) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t) override;
  std::optional<model::DocumentRecord> GetDocumentByFilename(Transaction&, const std::string&) override;
  std::vector<model::DocumentRecord> ListDocuments(Transaction&) override;
  Result UpdateDocument(Transaction&, const model::DocumentRecord&) override;
  Result DeleteDocument(Transaction&, int64_t) override;

  Result UpdateSentence(Transaction&, int64_t document_id, const model::SentenceRecord&) override;

private:
  friend class MemoryTransaction;

  struct State {
    // ordered so ListDocuments returns id order
    std::map<int64_t, model::DocumentRecord> documents;
    std::unordered_map<std::string, int64_t> filename_to_id;
    int64_t next_document_id = 1;
    int64_t next_sentence_id = 1;
  };

  static MemoryTransaction& TX(Transaction& t);

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
