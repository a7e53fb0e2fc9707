#pragma once

#include <cstdint>
#include <string_view>

namespace docrev::model {

/*
  How the revision injector renders the per-sentence timeline.

    kFinal       - insertions present, default view shows plain text
    kSuggestions - insertions present, shown as live tracked changes
    kClean       - no insertions, document-level properties only
*/
enum class RenderMode : std::uint8_t {
  kFinal       = 0,
  kSuggestions = 1,
  kClean       = 2,
};

constexpr std::string_view ToString(RenderMode mode) {
  switch (mode) {
    case RenderMode::kFinal:
      return "final";
    case RenderMode::kSuggestions:
      return "suggestions";
    case RenderMode::kClean:
      return "clean";
    default:
      return "unknown";
  }
}

constexpr bool EmitsInsertions(RenderMode mode) {
  return mode == RenderMode::kFinal || mode == RenderMode::kSuggestions;
}

// Throws util::UnsupportedMode for anything but "final", "suggestions", "clean".
RenderMode ParseRenderMode(std::string_view value);

// Throws util::UnsupportedMode for integers outside the enum.
RenderMode RenderModeFromInt(int value);

} // namespace docrev::model
