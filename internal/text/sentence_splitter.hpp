#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docrev::text {

/*
  Splits raw text into sentences for the timeline generator.

  kBoundary: breaks after '.', '!' or '?' when followed by whitespace and
             an uppercase letter. Abbreviations shaped like "Mr." or "e.g."
             do not end a sentence. Text without a boundary is returned as
             a single sentence.
  kSimple:   breaks on every run of '.', '!' or '?' and drops the
             punctuation.

  Whitespace runs are collapsed to single spaces. Empty or blank input
  yields an empty list; callers decide whether that is an error.
*/
enum class SplitMethod {
  kBoundary,
  kSimple,
};

std::vector<std::string> SplitSentences(std::string_view text, SplitMethod method = SplitMethod::kBoundary);

// Collapses whitespace runs to one space and trims both ends.
std::string NormalizeWhitespace(std::string_view text);

} // namespace docrev::text
