#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using docrev::db::ErrorCode;
using docrev::db::Repository;
using docrev::db::memory::MemoryRepository;
using docrev::db::model::DocumentRecord;
using docrev::db::model::SentenceRecord;
using docrev::model::RenderMode;
using docrev::util::FromUnixSeconds;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
  std::string                                       db_path;
};

DocumentRecord MakeDocument(const std::string& filename, size_t sentences) {
  DocumentRecord doc;
  doc.filename         = filename;
  doc.author           = "Jane Doe";
  doc.last_modified_by = "Jane Doe";
  doc.created_at       = FromUnixSeconds(1'704'103'200);
  doc.last_modified    = doc.created_at + std::chrono::seconds(60 * (sentences - 1));

  doc.properties.title                   = "Report";
  doc.properties.total_edit_time_minutes = 12;
  doc.properties.mode                    = RenderMode::kSuggestions;

  for (size_t i = 0; i < sentences; ++i) {
    SentenceRecord s;
    s.position    = static_cast<uint32_t>(i);
    s.text        = "Sentence " + std::to_string(i) + ".";
    s.created_at  = doc.created_at + std::chrono::seconds(60 * i);
    s.modified_at = s.created_at;
    s.author      = "Jane Doe";
    s.revision_id = static_cast<uint32_t>(i + 1);
    doc.sentences.push_back(std::move(s));
  }
  return doc;
}

void VerifyInsertGetList(Repository& repo, const std::string& prefix) {
  auto doc = MakeDocument(prefix + "/a.docx", 3);
  {
    auto tx = repo.Begin();
    assert(repo.InsertDocument(*tx, doc));
    assert(doc.id != 0);
    for (const auto& s : doc.sentences) assert(s.id != 0);

    // visible inside the writing transaction
    assert(repo.GetDocument(*tx, doc.id).has_value());
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto by_id = repo.GetDocument(*tx, doc.id);
  assert(by_id.has_value());
  assert(by_id->filename == doc.filename);
  assert(by_id->created_at == doc.created_at);
  assert(by_id->last_modified == doc.last_modified);
  assert(by_id->properties.title == std::optional<std::string>("Report"));
  assert(!by_id->properties.subject.has_value());
  assert(by_id->properties.total_edit_time_minutes == std::optional<uint32_t>(12));
  assert(by_id->properties.mode == RenderMode::kSuggestions);

  assert(by_id->sentences.size() == 3);
  for (uint32_t i = 0; i < 3; ++i) {
    assert(by_id->sentences[i].position == i);
    assert(by_id->sentences[i].revision_id == i + 1);
    assert(by_id->sentences[i].text == doc.sentences[i].text);
    assert(by_id->sentences[i].created_at == doc.sentences[i].created_at);
  }

  auto by_name = repo.GetDocumentByFilename(*tx, doc.filename);
  assert(by_name.has_value());
  assert(by_name->id == doc.id);
  assert(!repo.GetDocumentByFilename(*tx, prefix + "/missing.docx").has_value());

  bool listed = false;
  for (const auto& d : repo.ListDocuments(*tx)) {
    if (d.id == doc.id) {
      listed = d.sentences.size() == 3;
    }
  }
  assert(listed);
  tx->Commit();
}

void VerifyDuplicateFilename(Repository& repo, const std::string& prefix) {
  auto tx    = repo.Begin();
  auto first = MakeDocument(prefix + "/dup.docx", 1);
  assert(repo.InsertDocument(*tx, first));

  auto second = MakeDocument(prefix + "/dup.docx", 2);
  auto result = repo.InsertDocument(*tx, second);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyUpdates(Repository& repo, const std::string& prefix) {
  auto doc = MakeDocument(prefix + "/edit.docx", 3);
  {
    auto tx = repo.Begin();
    assert(repo.InsertDocument(*tx, doc));
    tx->Commit();
  }

  const auto edited_at = FromUnixSeconds(1'750'000'000);
  {
    auto tx = repo.Begin();

    auto sentence        = doc.sentences[1];
    sentence.modified_at = edited_at;
    sentence.revision_id = 4;
    assert(repo.UpdateSentence(*tx, doc.id, sentence));

    auto stored          = doc;
    stored.last_modified = edited_at;
    stored.properties.title.reset();
    stored.properties.mode = RenderMode::kClean;
    assert(repo.UpdateDocument(*tx, stored));

    SentenceRecord missing;
    missing.position = 99;
    assert(repo.UpdateSentence(*tx, doc.id, missing).code == ErrorCode::NotFound);
    assert(repo.UpdateSentence(*tx, doc.id + 1000, sentence).code == ErrorCode::NotFound);

    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto read = repo.GetDocument(*tx, doc.id);
  assert(read.has_value());
  assert(read->last_modified == edited_at);
  assert(!read->properties.title.has_value());
  assert(read->properties.mode == RenderMode::kClean);
  assert(read->sentences[1].modified_at == edited_at);
  assert(read->sentences[1].revision_id == 4);
  assert(read->sentences[0].modified_at == doc.sentences[0].modified_at);
  assert(read->sentences[2].revision_id == 3);
  tx->Commit();
}

void VerifyCascadeDelete(Repository& repo, const std::string& prefix) {
  auto doc = MakeDocument(prefix + "/gone.docx", 2);
  {
    auto tx = repo.Begin();
    assert(repo.InsertDocument(*tx, doc));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteDocument(*tx, doc.id));
    assert(repo.DeleteDocument(*tx, doc.id).code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetDocument(*tx, doc.id).has_value());
  assert(!repo.GetDocumentByFilename(*tx, doc.filename).has_value());
  assert(repo.UpdateSentence(*tx, doc.id, doc.sentences[0]).code == ErrorCode::NotFound);

  // the filename is free again
  auto again = MakeDocument(doc.filename, 1);
  assert(repo.InsertDocument(*tx, again));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto filename = prefix + "/rollback.docx";
  {
    auto tx  = repo.Begin();
    auto doc = MakeDocument(filename, 1);
    assert(repo.InsertDocument(*tx, doc));
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto tx  = repo.Begin();
    auto doc = MakeDocument(filename, 1);
    assert(repo.InsertDocument(*tx, doc));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetDocumentByFilename(*check_tx, filename).has_value());
  check_tx->Commit();
}

void VerifyConcurrentCommit(Repository& repo, const std::string& prefix, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1    = repo.Begin();
  auto tx2    = repo.Begin();
  auto reader = repo.Begin();

  auto a = MakeDocument(prefix + "/c1.docx", 1);
  auto b = MakeDocument(prefix + "/c2.docx", 1);
  assert(repo.InsertDocument(*tx1, a));
  assert(repo.InsertDocument(*tx2, b));
  tx1->Commit();

  // a transaction that only read never conflicts
  assert(!repo.GetDocumentByFilename(*reader, a.filename).has_value());
  reader->Commit();

  bool threw = false;
  try {
    tx2->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto check = repo.Begin();
  assert(repo.GetDocumentByFilename(*check, a.filename).has_value());
  assert(!repo.GetDocumentByFilename(*check, b.filename).has_value());
  check->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  auto doc  = MakeDocument(prefix + "/durable.docx", 4);
  {
    auto tx = repo->Begin();
    assert(repo->InsertDocument(*tx, doc));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto read = repo->GetDocumentByFilename(*tx, doc.filename);
  assert(read.has_value());
  assert(read->sentences.size() == 4);
  assert(read->sentences[3].text == "Sentence 3.");
  assert(read->properties.total_edit_time_minutes == std::optional<uint32_t>(12));
  tx->Commit();
}

// Sentences that cannot be read must fail the lookup, never come back empty.
void VerifyUnreadableSentencesRaise(BackendFactory& backend, const std::string& prefix) {
  if (backend.db_path.empty()) {
    return;
  }

  auto repo = backend.make_repository();
  auto doc  = MakeDocument(prefix + "/damaged.docx", 2);
  {
    auto tx = repo->Begin();
    assert(repo->InsertDocument(*tx, doc));
    tx->Commit();
  }

  sqlite3* raw = nullptr;
  assert(sqlite3_open(backend.db_path.c_str(), &raw) == SQLITE_OK);
  assert(sqlite3_exec(raw, "DROP TABLE sentences;", nullptr, nullptr, nullptr) == SQLITE_OK);
  sqlite3_close(raw);

  auto tx = repo->Begin();

  bool threw = false;
  try {
    repo->GetDocumentByFilename(*tx, doc.filename);
  } catch (const docrev::util::IOError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    repo->ListDocuments(*tx);
  } catch (const docrev::util::IOError&) {
    threw = true;
  }
  assert(threw);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("docrev_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<docrev::db::sqlite::SqliteDB>(db_path);
    docrev::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<docrev::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
      .db_path                        = db_path,
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  const auto prefix = "/tmp/" + backend.name;
  VerifyInsertGetList(*repo, prefix);
  VerifyDuplicateFilename(*repo, prefix);
  VerifyUpdates(*repo, prefix);
  VerifyCascadeDelete(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyConcurrentCommit(*repo, prefix, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, prefix);
  VerifyUnreadableSentencesRaise(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "docrev_integration_repository_parity: pass\n";
  return 0;
}
