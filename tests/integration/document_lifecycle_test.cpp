#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include "internal/core/document_service.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ooxml/xml_part.hpp"
#include "internal/package/package.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/time.hpp"

namespace {

using docrev::core::CreateRequest;
using docrev::core::DocumentService;
using docrev::core::SanitizeRequest;
using docrev::model::RenderMode;
using docrev::util::FormatW3CDTF;
using docrev::util::ParseTimestamp;

constexpr const char* kScenarioText = "This is sentence one. This is sentence two. This is sentence three.";

template <typename E, typename F>
bool Throws(F&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

// w:date of every w:ins in body order.
std::vector<std::string> InsertionDates(const std::filesystem::path& path) {
  const auto pkg = docrev::package::ReadPackageFile(path);

  pugi::xml_document doc;
  docrev::ooxml::LoadPart(pkg.at("word/document.xml"), "word/document.xml", &doc);

  std::vector<std::string> dates;
  for (auto p : doc.document_element().child("w:body").children("w:p")) {
    dates.emplace_back(p.child("w:ins").attribute("w:date").value());
  }
  return dates;
}

/*
  MemoryRepository whose commits can be made to fail after every write of
  the transaction has been staged.
*/
class CommitFailingRepository final : public docrev::db::Repository {
 public:
  bool fail_commits = false;

  std::unique_ptr<docrev::db::Transaction> Begin() override {
    return std::make_unique<Tx>(inner_.Begin(), &fail_commits);
  }

  docrev::db::Result InsertDocument(docrev::db::Transaction& t, docrev::db::model::DocumentRecord& record) override {
    return inner_.InsertDocument(Inner(t), record);
  }
  std::optional<docrev::db::model::DocumentRecord> GetDocument(docrev::db::Transaction& t, int64_t id) override {
    return inner_.GetDocument(Inner(t), id);
  }
  std::optional<docrev::db::model::DocumentRecord> GetDocumentByFilename(docrev::db::Transaction& t,
                                                                         const std::string& filename) override {
    return inner_.GetDocumentByFilename(Inner(t), filename);
  }
  std::vector<docrev::db::model::DocumentRecord> ListDocuments(docrev::db::Transaction& t) override {
    return inner_.ListDocuments(Inner(t));
  }
  docrev::db::Result UpdateDocument(docrev::db::Transaction& t, const docrev::db::model::DocumentRecord& record) override {
    return inner_.UpdateDocument(Inner(t), record);
  }
  docrev::db::Result DeleteDocument(docrev::db::Transaction& t, int64_t id) override {
    return inner_.DeleteDocument(Inner(t), id);
  }
  docrev::db::Result UpdateSentence(docrev::db::Transaction& t, int64_t document_id,
                                    const docrev::db::model::SentenceRecord& record) override {
    return inner_.UpdateSentence(Inner(t), document_id, record);
  }

 private:
  class Tx final : public docrev::db::Transaction {
   public:
    Tx(std::unique_ptr<docrev::db::Transaction> inner, const bool* fail) : inner_(std::move(inner)), fail_(fail) {
    }

    void Commit() override {
      if (*fail_) {
        throw docrev::util::IOError("commit rejected");
      }
      inner_->Commit();
    }
    void Rollback() override {
      inner_->Rollback();
    }
    bool IsCommitted() const override {
      return inner_->IsCommitted();
    }

    docrev::db::Transaction& Inner() {
      return *inner_;
    }

   private:
    std::unique_ptr<docrev::db::Transaction> inner_;
    const bool*                              fail_;
  };

  static docrev::db::Transaction& Inner(docrev::db::Transaction& t) {
    return static_cast<Tx&>(t).Inner();
  }

  docrev::db::memory::MemoryRepository inner_;
};

DocumentService MakeService() {
  docrev::core::ServiceOptions options;
  options.default_author = "Jane Doe";
  return DocumentService(std::make_shared<docrev::db::memory::MemoryRepository>(), options,
                         std::make_shared<docrev::util::Mt19937RandomSource>(7));
}

void TestCreateEditSanitizeDelete(const std::filesystem::path& dir) {
  auto       service = MakeService();
  const auto output  = dir / "scenario.docx";

  CreateRequest create;
  create.text                 = kScenarioText;
  create.output               = output;
  create.start                = ParseTimestamp("2024-01-01T10:00:00Z");
  create.min_interval_seconds = 60;
  create.max_interval_seconds = 60;
  create.mode                 = RenderMode::kSuggestions;
  create.properties.title     = "Scenario";

  const auto created = service.Create(create);
  assert(created.sentences.size() == 3);
  assert(created.author == "Jane Doe");
  assert(std::filesystem::exists(output));

  auto dates = InsertionDates(output);
  assert(dates.size() == 3);
  assert(dates[0] == "2024-01-01T10:00:00Z");
  assert(dates[1] == "2024-01-01T10:01:00Z");
  assert(dates[2] == "2024-01-01T10:02:00Z");

  // Edit the middle sentence.
  const auto edited = service.EditTimestamp(output, 1, ParseTimestamp("2025-06-15T14:30:00Z"));
  assert(edited.revision_id == 2);
  assert(FormatW3CDTF(edited.modified_at) == "2025-06-15T14:30:00Z");

  dates = InsertionDates(output);
  assert(dates[0] == "2024-01-01T10:00:00Z");
  assert(dates[1] == "2025-06-15T14:30:00Z");
  assert(dates[2] == "2024-01-01T10:02:00Z");

  const auto stored = service.Get(output);
  assert(FormatW3CDTF(stored.last_modified) == "2025-06-15T14:30:00Z");
  assert(FormatW3CDTF(stored.sentences[1].created_at) == "2024-01-01T10:01:00Z");
  for (uint32_t i = 0; i < 3; ++i) {
    assert(stored.sentences[i].revision_id == i + 1);
  }

  const auto pkg = docrev::package::ReadPackageFile(output);
  assert(pkg.at("word/settings.xml").find("w:trackRevisions") != std::string::npos);
  assert(pkg.at("docProps/core.xml").find("2025-06-15T14:30:00Z") != std::string::npos);

  const auto json = service.DescribeJson(output);
  assert(json.find("\"sentence_count\": 3") != std::string::npos);
  assert(json.find("\"mode\": \"suggestions\"") != std::string::npos);
  assert(json.find("\"title\": \"Scenario\"") != std::string::npos);

  // Fresh revision id on request.
  docrev::core::EditOptions bump;
  bump.new_revision = true;
  assert(service.EditTimestamp(output, 2, ParseTimestamp("2025-06-16"), bump).revision_id == 4);

  // Sanitize into a copy; the store is not involved.
  SanitizeRequest sanitize;
  sanitize.input           = output;
  sanitize.output          = dir / "clean.docx";
  sanitize.neutral_instant = ParseTimestamp("2000-01-01T00:00:00Z");

  const auto report = service.SanitizeFile(sanitize);
  assert(report.unwrapped_insertions == 3);

  const auto cleaned = docrev::package::ReadPackageFile(dir / "clean.docx");
  for (const auto& [name, bytes] : cleaned) {
    assert(bytes.find("Jane Doe") == std::string::npos);
    assert(bytes.find("w:ins") == std::string::npos);
    (void)name;
  }
  assert(cleaned.at("docProps/core.xml").find("2000-01-01T00:00:00Z") != std::string::npos);
  assert(docrev::package::ReadPackageFile(output).at("word/document.xml").find("w:ins") != std::string::npos);

  // Delete drops the metadata, not the file.
  service.Delete(output);
  assert(std::filesystem::exists(output));
  assert(Throws<docrev::util::NotFound>([&] { (void)service.Get(output); }));
  assert(service.List().empty());
}

void TestEditRejections(const std::filesystem::path& dir) {
  auto       service = MakeService();
  const auto output  = dir / "edits.docx";

  CreateRequest create;
  create.text   = kScenarioText;
  create.output = output;
  create.start  = ParseTimestamp("2024-01-01T10:00:00Z");
  service.Create(create);

  assert(Throws<docrev::util::NotFound>(
      [&] { (void)service.EditTimestamp(dir / "unknown.docx", 0, ParseTimestamp("2024-02-01")); }));
  assert(Throws<docrev::util::InvalidArgument>([&] { (void)service.EditTimestamp(output, 3, ParseTimestamp("2024-02-01")); }));
  assert(Throws<docrev::util::InvalidTimestamp>([&] { (void)service.EditTimestamp(output, 0, ParseTimestamp("2023-12-31")); }));

  // Rejected edits leave the store untouched.
  const auto stored = service.Get(output);
  assert(stored.sentences[0].created_at == stored.sentences[0].modified_at);
}

void TestCreateValidation(const std::filesystem::path& dir) {
  auto service = MakeService();

  CreateRequest empty;
  empty.text   = "   ";
  empty.output = dir / "empty.docx";
  assert(Throws<docrev::util::EmptyInput>([&] { (void)service.Create(empty); }));
  assert(!std::filesystem::exists(dir / "empty.docx"));

  CreateRequest inverted;
  inverted.text                 = kScenarioText;
  inverted.output               = dir / "inverted.docx";
  inverted.min_interval_seconds = 10;
  inverted.max_interval_seconds = 5;
  assert(Throws<docrev::util::InvalidInterval>([&] { (void)service.Create(inverted); }));

  CreateRequest no_output;
  no_output.text = kScenarioText;
  assert(Throws<docrev::util::InvalidArgument>([&] { (void)service.Create(no_output); }));

  assert(service.List().empty());
}

void TestCreateReplacesExistingDocument(const std::filesystem::path& dir) {
  auto service = MakeService();

  CreateRequest create;
  create.text   = kScenarioText;
  create.output = dir / "replace.docx";
  create.mode   = RenderMode::kClean;
  service.Create(create);

  create.text = "Only one sentence now.";
  service.Create(create);

  const auto documents = service.List();
  assert(documents.size() == 1);
  assert(documents[0].sentences.size() == 1);
  assert(documents[0].properties.mode == RenderMode::kClean);

  const auto pkg = docrev::package::ReadPackageFile(dir / "replace.docx");
  assert(pkg.at("word/document.xml").find("w:ins") == std::string::npos);
  assert(pkg.at("word/document.xml").find("Only one sentence now.") != std::string::npos);
}

void TestFailedCommitLeavesFileMatchingStore(const std::filesystem::path& dir) {
  auto repository = std::make_shared<CommitFailingRepository>();
  DocumentService service(repository, docrev::core::ServiceOptions{}, std::make_shared<docrev::util::Mt19937RandomSource>(7));

  CreateRequest create;
  create.text                 = kScenarioText;
  create.output               = dir / "commit_failure.docx";
  create.start                = ParseTimestamp("2024-01-01T10:00:00Z");
  create.min_interval_seconds = 60;
  create.max_interval_seconds = 60;
  create.mode                 = RenderMode::kSuggestions;
  service.Create(create);

  const auto before = docrev::util::ReadFile(create.output);

  repository->fail_commits = true;
  assert(Throws<docrev::util::IOError>(
      [&] { (void)service.EditTimestamp(create.output, 1, ParseTimestamp("2025-06-15T14:30:00Z")); }));
  assert(docrev::util::ReadFile(create.output) == before);

  CreateRequest fresh = create;
  fresh.output        = dir / "never_committed.docx";
  assert(Throws<docrev::util::IOError>([&] { (void)service.Create(fresh); }));
  assert(!std::filesystem::exists(fresh.output));

  repository->fail_commits = false;
  const auto stored        = service.Get(create.output);
  assert(FormatW3CDTF(stored.sentences[1].modified_at) == "2024-01-01T10:01:00Z");
  assert(InsertionDates(create.output)[1] == "2024-01-01T10:01:00Z");
  assert(Throws<docrev::util::NotFound>([&] { (void)service.Get(fresh.output); }));
}

} // namespace

int main() {
  const auto dir = std::filesystem::temp_directory_path() / "docrev_document_lifecycle_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  TestCreateEditSanitizeDelete(dir);
  TestEditRejections(dir);
  TestCreateValidation(dir);
  TestCreateReplacesExistingDocument(dir);
  TestFailedCommitLeavesFileMatchingStore(dir);

  std::filesystem::remove_all(dir);

  std::cout << "docrev_integration_document_lifecycle: pass\n";
  return 0;
}
