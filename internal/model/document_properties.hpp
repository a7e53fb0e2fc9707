#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/render_mode.hpp"

namespace docrev::model {

/*
  Document-level properties written into docProps/core.xml and
  docProps/app.xml. Unset fields are omitted from the package.
*/
struct DocumentProperties {
  std::optional<std::string> title;
  std::optional<std::string> subject;
  std::optional<std::string> keywords;
  std::optional<std::string> comments;

  // Whole minutes; maps to TotalTime in the extended properties part.
  std::optional<uint32_t> total_edit_time_minutes;

  RenderMode mode = RenderMode::kFinal;
};

} // namespace docrev::model
