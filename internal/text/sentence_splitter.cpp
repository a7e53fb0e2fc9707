#include "sentence_splitter.hpp"

#include <cctype>

namespace docrev::text {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsUpper(char c) {
  return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool IsLower(char c) {
  return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool IsWord(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool IsTerminator(char c) {
  return c == '.' || c == '!' || c == '?';
}

// `end` indexes the terminator. Rejects "Mr." / "Dr." style titles and
// dotted abbreviations such as "e.g." or "U.S.". The dotted form holds
// whatever terminator follows it, so "a.m? Next" stays one sentence.
bool EndsWithAbbreviation(const std::string& s, size_t end) {
  // [A-Z][a-z].
  if (s[end] == '.' && end >= 2 && IsUpper(s[end - 2]) && IsLower(s[end - 1])) {
    return true;
  }

  // \w.\w<terminator>
  if (end >= 3 && IsWord(s[end - 3]) && s[end - 2] == '.' && IsWord(s[end - 1])) {
    return true;
  }

  return false;
}

void PushTrimmed(std::vector<std::string>* out, std::string_view piece) {
  size_t begin = 0;
  size_t end   = piece.size();
  while (begin < end && IsSpace(piece[begin])) ++begin;
  while (end > begin && IsSpace(piece[end - 1])) --end;
  if (end > begin) {
    out->emplace_back(piece.substr(begin, end - begin));
  }
}

std::vector<std::string> SplitOnBoundaries(const std::string& text) {
  std::vector<std::string> sentences;
  size_t                   start = 0;

  for (size_t i = 0; i + 2 < text.size(); ++i) {
    if (!IsTerminator(text[i]) || text[i + 1] != ' ' || !IsUpper(text[i + 2])) {
      continue;
    }
    if (EndsWithAbbreviation(text, i)) {
      continue;
    }
    PushTrimmed(&sentences, std::string_view(text).substr(start, i + 1 - start));
    start = i + 2;
  }

  PushTrimmed(&sentences, std::string_view(text).substr(start));

  if (sentences.empty()) {
    sentences.push_back(text);
  }
  return sentences;
}

std::vector<std::string> SplitOnPunctuation(const std::string& text) {
  std::vector<std::string> sentences;
  size_t                   start = 0;

  for (size_t i = 0; i < text.size(); ++i) {
    if (IsTerminator(text[i])) {
      PushTrimmed(&sentences, std::string_view(text).substr(start, i - start));
      start = i + 1;
    }
  }
  PushTrimmed(&sentences, std::string_view(text).substr(start));
  return sentences;
}

} // namespace

std::string NormalizeWhitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  bool pending_space = false;
  for (char c : text) {
    if (IsSpace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::vector<std::string> SplitSentences(std::string_view text, SplitMethod method) {
  const auto normalized = NormalizeWhitespace(text);
  if (normalized.empty()) {
    return {};
  }

  if (method == SplitMethod::kSimple) {
    return SplitOnPunctuation(normalized);
  }
  return SplitOnBoundaries(normalized);
}

} // namespace docrev::text
