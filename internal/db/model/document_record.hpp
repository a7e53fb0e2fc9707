#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/sentence_record.hpp"
#include "internal/model/document_properties.hpp"
#include "internal/util/time.hpp"

namespace docrev::db::model {

/*
  Persistent document row plus its owned sentences (document order).

  The package on disk is a projection of this record: properties and
  mode are stored so a rebuild reproduces the same rendering.
*/

struct DocumentRecord {
  int64_t id = 0; // row id, assigned by the repository

  std::string filename;

  util::TimePoint created_at{};
  util::TimePoint last_modified{};

  std::string author;
  std::string last_modified_by;

  docrev::model::DocumentProperties properties;

  std::vector<SentenceRecord> sentences;
};

} // namespace docrev::db::model
