#include "document_service.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/package/package.hpp"
#include "internal/revision/revision_injector.hpp"
#include "internal/timeline/timeline_generator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace docrev::core {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + " (" + result.Describe() + ")";
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
      throw util::IOError(message);
    default:
      throw std::runtime_error(message);
  }
}

util::TimePoint LatestModification(const std::vector<db::model::SentenceRecord>& sentences) {
  util::TimePoint latest = sentences.front().modified_at;
  for (const auto& sentence : sentences) {
    latest = std::max(latest, sentence.modified_at);
  }
  return latest;
}

package::Package Render(const db::model::DocumentRecord& record, const builder::BuilderOptions& base) {
  builder::BuilderOptions options = base;
  options.last_modified_by        = record.last_modified_by;

  const builder::DocumentBuilder   document_builder(options);
  const revision::RevisionInjector injector;

  auto baseline = document_builder.Build(record.sentences, record.properties, record.author);
  return injector.Inject(baseline, record.sentences, record.properties.mode);
}

db::model::DocumentRecord Require(db::Repository& repository, db::Transaction& tx, const std::string& key) {
  auto record = repository.GetDocumentByFilename(tx, key);
  if (!record) {
    throw util::NotFound("no metadata stored for " + key);
  }
  return std::move(*record);
}

/*
  Replaces the file, then commits. If the commit fails the previous bytes
  (or the absence of a file) are put back, so the package on disk never
  carries a timeline the store does not.
*/
void PublishAndCommit(const std::filesystem::path& path, const package::Package& pkg, db::Transaction& tx) {
  std::error_code            ec;
  std::optional<std::string> previous;
  if (std::filesystem::is_regular_file(path, ec)) {
    previous = util::ReadFile(path);
  }

  package::WritePackageFile(path, pkg);
  try {
    tx.Commit();
  } catch (const std::exception& commit_error) {
    try {
      if (previous) {
        util::WriteFileAtomic(path, *previous);
      } else {
        std::filesystem::remove(path);
      }
      DOCREV_LOG_WARN("commit failed, document restored", {observability::StringField("filename", path.string()),
                                                           observability::StringField("error", commit_error.what())});
    } catch (const std::exception& restore_error) {
      DOCREV_LOG_ERROR("could not restore document after failed commit",
                       {observability::StringField("filename", path.string()),
                        observability::StringField("error", restore_error.what())});
    }
    throw;
  }
}

} // namespace

std::string DocumentKey(const std::filesystem::path& document) {
  return std::filesystem::absolute(document).lexically_normal().string();
}

docrev::v1::DocumentMetadata ToMetadata(const db::model::DocumentRecord& record) {
  docrev::v1::DocumentMetadata out;
  out.set_id(record.id);
  out.set_filename(record.filename);
  out.set_created_at(util::FormatW3CDTF(record.created_at));
  out.set_last_modified(util::FormatW3CDTF(record.last_modified));
  out.set_author(record.author);
  out.set_last_modified_by(record.last_modified_by);
  out.set_mode(std::string(model::ToString(record.properties.mode)));
  out.set_sentence_count(static_cast<uint32_t>(record.sentences.size()));

  const auto& props = record.properties;
  if (props.title) out.set_title(*props.title);
  if (props.subject) out.set_subject(*props.subject);
  if (props.keywords) out.set_keywords(*props.keywords);
  if (props.comments) out.set_comments(*props.comments);
  if (props.total_edit_time_minutes) out.set_total_edit_time_minutes(*props.total_edit_time_minutes);

  for (const auto& sentence : record.sentences) {
    auto* s = out.add_sentences();
    s->set_position(sentence.position);
    s->set_text(sentence.text);
    s->set_created(util::FormatW3CDTF(sentence.created_at));
    s->set_modified(util::FormatW3CDTF(sentence.modified_at));
    s->set_author(sentence.author);
    s->set_revision_id(sentence.revision_id);
  }
  return out;
}

sanitize::SanitizeReport SanitizeFile(const SanitizeRequest& request, const ServiceOptions& options) {
  auto sanitize_options = options.sanitize;
  if (request.neutral_author) sanitize_options.neutral_author = *request.neutral_author;
  sanitize_options.keep_content = request.keep_content;

  const auto instant = util::TruncateToSeconds(request.neutral_instant.value_or(options.neutral_instant));
  const auto output  = request.output.value_or(request.input);

  const auto input = package::ReadPackageFile(request.input);

  sanitize::SanitizeReport report;
  const auto               cleaned = sanitize::Sanitizer(sanitize_options).Sanitize(input, instant, &report);
  package::WritePackageFile(output, cleaned);

  DOCREV_LOG_INFO("document sanitized", {observability::StringField("input", request.input.string()),
                                         observability::StringField("output", output.string()),
                                         observability::IntField("unwrapped_insertions", report.unwrapped_insertions),
                                         observability::IntField("removed_deletions", report.removed_deletions)});
  return report;
}

// ---------------------------------------------------------------------
// DocumentService
// ---------------------------------------------------------------------

DocumentService::DocumentService(std::shared_ptr<db::Repository> repository, ServiceOptions options,
                                 std::shared_ptr<util::RandomSource> random)
    : repository_(std::move(repository)), options_(std::move(options)), random_(std::move(random)) {
}

db::model::DocumentRecord DocumentService::Create(const CreateRequest& request) {
  if (request.output.empty()) {
    throw util::InvalidArgument("create: output path is empty");
  }
  const auto author = request.author.value_or(options_.default_author);

  timeline::TimelineOptions timeline;
  timeline.start                = request.start;
  timeline.min_interval_seconds = request.min_interval_seconds.value_or(options_.min_interval_seconds);
  timeline.max_interval_seconds = request.max_interval_seconds.value_or(options_.max_interval_seconds);
  timeline.author               = author;
  timeline::ValidateInterval(timeline.min_interval_seconds, timeline.max_interval_seconds);

  const auto sentences = text::SplitSentences(request.text, request.split_method);
  if (sentences.empty()) {
    throw util::EmptyInput("text contains no sentences");
  }

  db::model::DocumentRecord record;
  record.filename         = DocumentKey(request.output);
  record.author           = author;
  record.last_modified_by = author;
  record.properties       = request.properties;
  record.properties.mode  = request.mode.value_or(options_.default_mode);
  record.sentences        = timeline::Generate(sentences, timeline, *random_);
  record.created_at       = record.sentences.front().created_at;
  record.last_modified    = LatestModification(record.sentences);

  const auto pkg = Render(record, options_.builder);

  auto tx = repository_->Begin();
  if (auto existing = repository_->GetDocumentByFilename(*tx, record.filename)) {
    ThrowIfDbError(repository_->DeleteDocument(*tx, existing->id), "replace document");
    DOCREV_LOG_INFO("replacing stored document", {observability::StringField("filename", record.filename)});
  }
  ThrowIfDbError(repository_->InsertDocument(*tx, record), "insert document");

  PublishAndCommit(request.output, pkg, *tx);

  DOCREV_LOG_INFO("document created", {observability::StringField("filename", record.filename),
                                       observability::IntField("sentences", static_cast<int64_t>(record.sentences.size())),
                                       observability::StringField("mode", model::ToString(record.properties.mode))});
  return record;
}

db::model::SentenceRecord DocumentService::EditTimestamp(const std::filesystem::path& document, uint32_t position,
                                                         util::TimePoint instant, const EditOptions& options) {
  const auto key = DocumentKey(document);

  auto tx     = repository_->Begin();
  auto record = Require(*repository_, *tx, key);

  if (position >= record.sentences.size()) {
    throw util::InvalidArgument("sentence " + std::to_string(position) + " out of range; " + key + " has " +
                                std::to_string(record.sentences.size()) + " sentences");
  }

  auto&      sentence = record.sentences[position];
  const auto edited   = util::TruncateToSeconds(instant);
  if (edited < sentence.created_at) {
    throw util::InvalidTimestamp("new timestamp " + util::FormatW3CDTF(edited) + " precedes sentence creation at " +
                                 util::FormatW3CDTF(sentence.created_at));
  }

  sentence.modified_at = edited;
  if (options.new_revision) {
    uint32_t max_id = 0;
    for (const auto& s : record.sentences) {
      max_id = std::max(max_id, s.revision_id);
    }
    sentence.revision_id = max_id + 1;
  }
  record.last_modified = std::max(record.created_at, LatestModification(record.sentences));

  const auto pkg = Render(record, options_.builder);

  ThrowIfDbError(repository_->UpdateSentence(*tx, record.id, sentence), "update sentence");
  ThrowIfDbError(repository_->UpdateDocument(*tx, record), "update document");

  PublishAndCommit(record.filename, pkg, *tx);

  DOCREV_LOG_INFO("sentence timestamp edited", {observability::StringField("filename", key), observability::IntField("position", position),
                                                observability::StringField("modified_at", util::FormatW3CDTF(edited)),
                                                observability::IntField("revision_id", sentence.revision_id)});
  return sentence;
}

db::model::DocumentRecord DocumentService::Get(const std::filesystem::path& document) {
  auto tx     = repository_->Begin();
  auto record = Require(*repository_, *tx, DocumentKey(document));
  tx->Commit();
  return record;
}

std::vector<db::model::DocumentRecord> DocumentService::List() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListDocuments(*tx);
  tx->Commit();
  return records;
}

void DocumentService::Delete(const std::filesystem::path& document) {
  const auto key = DocumentKey(document);

  auto tx     = repository_->Begin();
  auto record = Require(*repository_, *tx, key);
  ThrowIfDbError(repository_->DeleteDocument(*tx, record.id), "delete document");
  tx->Commit();

  DOCREV_LOG_INFO("document metadata deleted", {observability::StringField("filename", key),
                                                observability::IntField("sentences", static_cast<int64_t>(record.sentences.size()))});
}

std::string DocumentService::DescribeJson(const std::filesystem::path& document) {
  const auto metadata = ToMetadata(Get(document));

  google::protobuf::util::JsonPrintOptions print_options;
  print_options.add_whitespace             = true;
  print_options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &json, print_options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render metadata as JSON: " + std::string(status.message()));
  }
  return json;
}

sanitize::SanitizeReport DocumentService::SanitizeFile(const SanitizeRequest& request) const {
  return core::SanitizeFile(request, options_);
}

} // namespace docrev::core
