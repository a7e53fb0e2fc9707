#include "render_mode.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace docrev::model {

RenderMode ParseRenderMode(std::string_view value) {
  if (value == "final") {
    return RenderMode::kFinal;
  }
  if (value == "suggestions") {
    return RenderMode::kSuggestions;
  }
  if (value == "clean") {
    return RenderMode::kClean;
  }
  throw util::UnsupportedMode("unsupported render mode '" + std::string(value) + "' (expected final, suggestions or clean)");
}

RenderMode RenderModeFromInt(int value) {
  switch (value) {
    case static_cast<int>(RenderMode::kFinal):
      return RenderMode::kFinal;
    case static_cast<int>(RenderMode::kSuggestions):
      return RenderMode::kSuggestions;
    case static_cast<int>(RenderMode::kClean):
      return RenderMode::kClean;
    default:
      throw util::UnsupportedMode("unsupported render mode value " + std::to_string(value));
  }
}

} // namespace docrev::model
