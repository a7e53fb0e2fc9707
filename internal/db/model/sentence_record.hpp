#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace docrev::db::model {

/*
  Persistent sentence row.

  IMPORTANT:
  - position is 0-based and contiguous within its document.
  - revision_id becomes the w:id of the sentence's insertion and must be
    unique within the document.
  - modified_at >= created_at.
*/

struct SentenceRecord {
  int64_t id = 0; // row id, assigned by the repository

  uint32_t    position = 0;
  std::string text;

  util::TimePoint created_at{};
  util::TimePoint modified_at{};

  std::string author;

  uint32_t revision_id = 1;
};

} // namespace docrev::db::model
