#pragma once

#include <string>

#include "internal/package/package.hpp"
#include "internal/util/time.hpp"

namespace docrev::sanitize {

struct SanitizeOptions {
  std::string neutral_author   = "Anonymous";
  std::string application_name = "Microsoft Office Word";

  // false: the body is replaced by one empty paragraph (section properties kept).
  bool keep_content = true;
};

// What a pass removed; all zero on an already sanitized package.
struct SanitizeReport {
  int unwrapped_insertions = 0;
  int removed_deletions    = 0;
  int removed_markers      = 0; // move ranges and property-change records
  int removed_settings     = 0;
};

/*
  Sanitizer

  Strips revision history from a package and neutralizes its metadata.

  Story parts (main body, headers, footers, footnotes, endnotes):
    w:ins, w:moveTo         unwrapped, content kept
    w:del, w:moveFrom       removed with their content
    table rows marked deleted are removed
    move range markers and *PrChange / numberingChange records removed

  Settings: w:trackRevisions and w:revisionView removed.

  Core properties: creator and lastModifiedBy set to the neutral author,
  title / subject / description / keywords emptied, created / modified /
  lastPrinted set to the neutral instant, revision reset to 1.

  App properties: Company / Manager / AppVersion / HyperlinkBase emptied,
  Application set to the configured name, TotalTime 0, Template
  Normal.dotm.

  Sanitize(Sanitize(p)) == Sanitize(p). The input is never modified.

  Throws:
    util::CorruptPackage      - a story, settings or properties part is not well-formed
    util::MissingRequiredPart - main document or core-properties part absent
*/
class Sanitizer {
 public:
  explicit Sanitizer(SanitizeOptions options = {});

  package::Package Sanitize(const package::Package& input, util::TimePoint neutral_instant, SanitizeReport* report = nullptr) const;

 private:
  std::string SanitizeStory(const std::string& bytes, const std::string& part_name, bool is_main, SanitizeReport* report) const;
  std::string SanitizeSettings(const std::string& bytes, const std::string& part_name, SanitizeReport* report) const;
  std::string SanitizeCore(const std::string& bytes, const std::string& part_name, util::TimePoint neutral_instant) const;
  std::string SanitizeApp(const std::string& bytes, const std::string& part_name) const;

  SanitizeOptions options_;
};

} // namespace docrev::sanitize
