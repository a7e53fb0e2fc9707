#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/sentence_record.hpp"
#include "internal/util/random.hpp"
#include "internal/util/time.hpp"

namespace docrev::timeline {

struct TimelineOptions {
  // Defaults to util::Now() truncated to seconds.
  std::optional<util::TimePoint> start;

  int64_t min_interval_seconds = 30;
  int64_t max_interval_seconds = 300;

  std::string author;
};

/*
  Synthesizes one SentenceRecord per text.

  Sentence 0 starts at `start`; each following sentence is created a
  uniformly drawn [min, max] seconds after its predecessor. created_at and
  modified_at are equal on every generated record, revision ids run 1..N
  and positions 0..N-1 in input order.

  Throws:
    util::InvalidInterval - min > max, either bound negative, or the
                            timeline would run past util::TimePoint::max()
    util::EmptyInput      - no texts, or any text empty
*/
std::vector<db::model::SentenceRecord> Generate(const std::vector<std::string>& texts, const TimelineOptions& options,
                                                util::RandomSource& random);

// Throws util::InvalidInterval; shared with the service's early validation.
void ValidateInterval(int64_t min_interval_seconds, int64_t max_interval_seconds);

} // namespace docrev::timeline
