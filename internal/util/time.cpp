#include "time.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"

namespace docrev::util {

namespace {

constexpr std::array<const char*, 6> kAcceptedFormats = {
    "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M", "%Y-%m-%d", "%Y/%m/%d %H:%M:%S", "%Y/%m/%d",
};

std::string Format(TimePoint tp, const char* pattern) {
  const std::time_t seconds = static_cast<std::time_t>(ToUnixSeconds(tp));
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, pattern);
  return out.str();
}

bool TryParse(const std::string& text, const char* pattern, TimePoint* out) {
  std::tm            parsed{};
  std::istringstream in(text);
  in >> std::get_time(&parsed, pattern);
  if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
    return false;
  }

  parsed.tm_isdst       = 0;
  std::tm     requested = parsed;
  std::time_t seconds   = timegm(&parsed);

  // timegm normalizes out-of-range fields (Feb 30 -> Mar 2); reject those.
  if (parsed.tm_year != requested.tm_year || parsed.tm_mon != requested.tm_mon || parsed.tm_mday != requested.tm_mday ||
      parsed.tm_hour != requested.tm_hour || parsed.tm_min != requested.tm_min || parsed.tm_sec != requested.tm_sec) {
    return false;
  }

  *out = FromUnixSeconds(static_cast<int64_t>(seconds));
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

TimePoint TruncateToSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp);
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(int64_t seconds) {
  return TimePoint{} + std::chrono::seconds(seconds);
}

std::string FormatW3CDTF(TimePoint tp) {
  return Format(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string FormatDisplay(TimePoint tp) {
  return Format(tp, "%Y-%m-%d %H:%M:%S");
}

TimePoint ParseTimestamp(std::string_view text) {
  std::string trimmed(text);
  while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) trimmed.pop_back();
  while (!trimmed.empty() && (trimmed.front() == ' ' || trimmed.front() == '\t')) trimmed.erase(trimmed.begin());

  if (!trimmed.empty() && (trimmed.back() == 'Z' || trimmed.back() == 'z')) {
    trimmed.pop_back();
  }

  if (!trimmed.empty()) {
    TimePoint parsed;
    for (const char* pattern : kAcceptedFormats) {
      if (TryParse(trimmed, pattern, &parsed)) {
        return parsed;
      }
    }
  }

  throw InvalidTimestamp("could not parse timestamp: '" + std::string(text) + "'");
}

} // namespace docrev::util
