#include "timeline_generator.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace docrev::timeline {
namespace {

// Last whole second util::TimePoint can hold.
int64_t LastRepresentableSecond() {
  return std::chrono::duration_cast<std::chrono::seconds>(util::TimePoint::max().time_since_epoch()).count();
}

} // namespace

void ValidateInterval(int64_t min_interval_seconds, int64_t max_interval_seconds) {
  if (min_interval_seconds < 0 || max_interval_seconds < 0) {
    throw util::InvalidInterval("interval bounds must be non-negative (min=" + std::to_string(min_interval_seconds) +
                                ", max=" + std::to_string(max_interval_seconds) + ")");
  }
  if (min_interval_seconds > max_interval_seconds) {
    throw util::InvalidInterval("min interval " + std::to_string(min_interval_seconds) + "s exceeds max interval " +
                                std::to_string(max_interval_seconds) + "s");
  }
  if (max_interval_seconds > LastRepresentableSecond()) {
    throw util::InvalidInterval("max interval " + std::to_string(max_interval_seconds) +
                                "s exceeds the representable time range");
  }
}

std::vector<db::model::SentenceRecord> Generate(const std::vector<std::string>& texts, const TimelineOptions& options,
                                                util::RandomSource& random) {
  ValidateInterval(options.min_interval_seconds, options.max_interval_seconds);

  if (texts.empty()) {
    throw util::EmptyInput("no sentences to place on the timeline");
  }
  for (size_t i = 0; i < texts.size(); ++i) {
    if (texts[i].empty()) {
      throw util::EmptyInput("sentence " + std::to_string(i) + " is empty");
    }
  }

  const int64_t last_second = LastRepresentableSecond();
  int64_t       cursor      = util::ToUnixSeconds(util::TruncateToSeconds(options.start.value_or(util::Now())));

  std::vector<db::model::SentenceRecord> records;
  records.reserve(texts.size());

  for (size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      const int64_t gap = random.UniformInt(options.min_interval_seconds, options.max_interval_seconds);
      if (gap > last_second - cursor) {
        throw util::InvalidInterval("sentence " + std::to_string(i) + " would be placed past the representable time range");
      }
      cursor += gap;
    }

    db::model::SentenceRecord record;
    record.position    = static_cast<uint32_t>(i);
    record.text        = texts[i];
    record.created_at  = util::FromUnixSeconds(cursor);
    record.modified_at = record.created_at;
    record.author      = options.author;
    record.revision_id = static_cast<uint32_t>(i + 1);
    records.push_back(std::move(record));
  }

  return records;
}

} // namespace docrev::timeline
