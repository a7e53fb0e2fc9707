#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using docrev::util::FormatDisplay;
using docrev::util::FormatW3CDTF;
using docrev::util::FromUnixSeconds;
using docrev::util::ParseTimestamp;
using docrev::util::ToUnixSeconds;

constexpr int64_t kNewYear2024Ten = 1'704'103'200; // 2024-01-01T10:00:00Z

bool Rejects(const std::string& text) {
  try {
    (void)ParseTimestamp(text);
  } catch (const docrev::util::InvalidTimestamp&) {
    return true;
  }
  return false;
}

void TestAcceptedForms() {
  assert(ToUnixSeconds(ParseTimestamp("2024-01-01T10:00:00Z")) == kNewYear2024Ten);
  assert(ToUnixSeconds(ParseTimestamp("2024-01-01T10:00:00")) == kNewYear2024Ten);
  assert(ToUnixSeconds(ParseTimestamp("2024-01-01 10:00:00")) == kNewYear2024Ten);
  assert(ToUnixSeconds(ParseTimestamp("2024-01-01 10:00")) == kNewYear2024Ten);
  assert(ToUnixSeconds(ParseTimestamp("2024/01/01 10:00:00")) == kNewYear2024Ten);
  assert(ToUnixSeconds(ParseTimestamp("  2024-01-01 10:00:00 ")) == kNewYear2024Ten);

  assert(ToUnixSeconds(ParseTimestamp("2024-01-01")) == kNewYear2024Ten - 36'000);
  assert(ToUnixSeconds(ParseTimestamp("2024/01/01")) == kNewYear2024Ten - 36'000);
}

void TestRejectsMalformedAndImpossibleDates() {
  assert(Rejects(""));
  assert(Rejects("yesterday"));
  assert(Rejects("2024-13-01"));
  assert(Rejects("2023-02-30"));
  assert(Rejects("2024-01-01 25:00:00"));
  assert(Rejects("2024-01-01T10:00:00+02:00"));
}

void TestFormatting() {
  const auto tp = FromUnixSeconds(kNewYear2024Ten);
  assert(FormatW3CDTF(tp) == "2024-01-01T10:00:00Z");
  assert(FormatDisplay(tp) == "2024-01-01 10:00:00");
  assert(FormatW3CDTF(FromUnixSeconds(946'684'800)) == "2000-01-01T00:00:00Z");
}

void TestTruncation() {
  const auto tp = FromUnixSeconds(10) + std::chrono::milliseconds(999);
  assert(docrev::util::TruncateToSeconds(tp) == FromUnixSeconds(10));
  assert(ToUnixSeconds(tp) == 10);
}

} // namespace

int main() {
  TestAcceptedForms();
  TestRejectsMalformedAndImpossibleDates();
  TestFormatting();
  TestTruncation();

  std::cout << "docrev_unit_time: pass\n";
  return 0;
}
