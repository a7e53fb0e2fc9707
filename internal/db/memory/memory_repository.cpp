#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace docrev::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction& MemoryRepository::TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result MemoryRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
  auto& state = TX(t).Mutable();

  if (state.filename_to_id.count(r.filename)) {
    return Result::Err(ErrorCode::AlreadyExists, "document already exists: " + r.filename);
  }

  r.id = state.next_document_id++;
  for (auto& s : r.sentences) {
    s.id = state.next_sentence_id++;
  }

  state.filename_to_id[r.filename] = r.id;
  state.documents[r.id]            = r;
  return Result::Ok();
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocument(Transaction& t, int64_t id) {
  const auto& state = TX(t).View();

  auto it = state.documents.find(id);
  if (it == state.documents.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocumentByFilename(Transaction& t, const std::string& filename) {
  const auto& state = TX(t).View();

  auto it = state.filename_to_id.find(filename);
  if (it == state.filename_to_id.end()) return std::nullopt;
  return state.documents.at(it->second);
}

std::vector<model::DocumentRecord> MemoryRepository::ListDocuments(Transaction& t) {
  const auto& state = TX(t).View();

  std::vector<model::DocumentRecord> out;
  out.reserve(state.documents.size());
  for (const auto& [id, doc] : state.documents) {
    out.push_back(doc);
  }
  return out;
}

Result MemoryRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r) {
  auto& state = TX(t).Mutable();

  auto it = state.documents.find(r.id);
  if (it == state.documents.end()) {
    return Result::Err(ErrorCode::NotFound, "document not found");
  }

  auto& stored = it->second;
  if (stored.filename != r.filename) {
    if (state.filename_to_id.count(r.filename)) {
      return Result::Err(ErrorCode::ConstraintViolation, "filename already in use: " + r.filename);
    }
    state.filename_to_id.erase(stored.filename);
    state.filename_to_id[r.filename] = r.id;
  }

  // document row only; sentences are owned by UpdateSentence
  stored.filename         = r.filename;
  stored.created_at       = r.created_at;
  stored.last_modified    = r.last_modified;
  stored.author           = r.author;
  stored.last_modified_by = r.last_modified_by;
  stored.properties       = r.properties;
  return Result::Ok();
}

Result MemoryRepository::DeleteDocument(Transaction& t, int64_t id) {
  auto& state = TX(t).Mutable();

  auto it = state.documents.find(id);
  if (it == state.documents.end()) {
    return Result::Err(ErrorCode::NotFound, "document not found");
  }

  state.filename_to_id.erase(it->second.filename);
  state.documents.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sentences
// ------------------------------------------------------------------

Result MemoryRepository::UpdateSentence(Transaction& t, int64_t document_id, const model::SentenceRecord& r) {
  auto& state = TX(t).Mutable();

  auto it = state.documents.find(document_id);
  if (it == state.documents.end()) {
    return Result::Err(ErrorCode::NotFound, "document not found");
  }

  for (auto& s : it->second.sentences) {
    if (s.position == r.position) {
      s.text        = r.text;
      s.created_at  = r.created_at;
      s.modified_at = r.modified_at;
      s.author      = r.author;
      s.revision_id = r.revision_id;
      return Result::Ok();
    }
  }

  return Result::Err(ErrorCode::NotFound, "sentence not found");
}

} // namespace docrev::db::memory
