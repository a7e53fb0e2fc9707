#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace docrev::util {

/*
  Time utilities: single place to control clock source and wire format.

  All instants are UTC. Revision dates and core properties are serialized
  at second precision as W3CDTF ("2024-01-01T10:00:00Z").
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

TimePoint TruncateToSeconds(TimePoint tp);

int64_t   ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(int64_t seconds);

std::string FormatW3CDTF(TimePoint tp);

// Human-readable form used by the CLI ("2024-01-01 10:00:00").
std::string FormatDisplay(TimePoint tp);

// Accepts the W3CDTF form and the CLI forms:
//   YYYY-MM-DD HH:MM:SS, YYYY-MM-DDTHH:MM:SS[Z], YYYY-MM-DD HH:MM,
//   YYYY-MM-DD, YYYY/MM/DD HH:MM:SS, YYYY/MM/DD
// Throws InvalidTimestamp.
TimePoint ParseTimestamp(std::string_view text);

} // namespace docrev::util
