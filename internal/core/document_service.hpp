#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docrev/v1/metadata.pb.h"
#include "internal/builder/document_builder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/document_properties.hpp"
#include "internal/sanitize/sanitizer.hpp"
#include "internal/text/sentence_splitter.hpp"
#include "internal/util/random.hpp"
#include "internal/util/time.hpp"

namespace docrev::core {

struct ServiceOptions {
  std::string       default_author       = "docrev";
  int64_t           min_interval_seconds = 30;
  int64_t           max_interval_seconds = 300;
  model::RenderMode default_mode         = model::RenderMode::kFinal;

  builder::BuilderOptions   builder;
  sanitize::SanitizeOptions sanitize;

  // 2000-01-01T00:00:00Z
  util::TimePoint neutral_instant = util::FromUnixSeconds(946684800);
};

struct CreateRequest {
  std::string           text;
  text::SplitMethod     split_method = text::SplitMethod::kBoundary;
  std::filesystem::path output;

  std::optional<std::string>       author;
  std::optional<util::TimePoint>   start;
  std::optional<int64_t>           min_interval_seconds;
  std::optional<int64_t>           max_interval_seconds;
  std::optional<model::RenderMode> mode;

  // mode inside is ignored; `mode` above (or the default) wins.
  model::DocumentProperties properties;
};

struct EditOptions {
  // Give the edited sentence a fresh revision id (max + 1).
  bool new_revision = false;
};

struct SanitizeRequest {
  std::filesystem::path                input;
  std::optional<std::filesystem::path> output; // defaults to input
  std::optional<util::TimePoint>       neutral_instant;
  std::optional<std::string>           neutral_author;
  bool                                 keep_content = true;
};

/*
  DocumentService

  Orchestrates the store and the package pipeline:

    create          text -> sentences -> timeline -> store + build + inject -> file
    edit-timestamp  store update -> rebuild the whole file from stored state
    sanitize        file -> strip revisions / neutralize metadata -> file

  Every write path builds the complete package in memory first and
  replaces the destination atomically; the store transaction commits only
  after the file is in place. Documents are keyed by their absolute,
  lexically normalized path.
*/
class DocumentService {
 public:
  DocumentService(std::shared_ptr<db::Repository> repository, ServiceOptions options,
                  std::shared_ptr<util::RandomSource> random = std::make_shared<util::Mt19937RandomSource>());

  db::model::DocumentRecord Create(const CreateRequest& request);

  // Returns the updated sentence.
  db::model::SentenceRecord EditTimestamp(const std::filesystem::path& document, uint32_t position, util::TimePoint instant,
                                          const EditOptions& options = {});

  db::model::DocumentRecord              Get(const std::filesystem::path& document);
  std::vector<db::model::DocumentRecord> List();

  // Removes the stored record and its sentences; the file is left alone.
  void Delete(const std::filesystem::path& document);

  std::string DescribeJson(const std::filesystem::path& document);

  sanitize::SanitizeReport SanitizeFile(const SanitizeRequest& request) const;

  const ServiceOptions& options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository>     repository_;
  ServiceOptions                      options_;
  std::shared_ptr<util::RandomSource> random_;
};

// Store-independent; used directly by the CLI's sanitize command.
sanitize::SanitizeReport SanitizeFile(const SanitizeRequest& request, const ServiceOptions& options);

std::string DocumentKey(const std::filesystem::path& document);

docrev::v1::DocumentMetadata ToMetadata(const db::model::DocumentRecord& record);

} // namespace docrev::core
