#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/package/package.hpp"

namespace docrev::ooxml {

/*
  Relationship-driven part lookup.

  A source part of "" means the package itself (_rels/.rels). Targets are
  resolved relative to the source part's directory; absolute targets
  ("/word/document.xml") are taken from the package root. External
  relationships are ignored.
*/

// "word/document.xml" -> "word/_rels/document.xml.rels"; "" -> "_rels/.rels".
std::string RelsPartName(const std::string& source_part);

// Resolves `target` against the directory of `source_part`.
std::string ResolveTarget(const std::string& source_part, const std::string& target);

// Every internal target of `rel_type` that exists in the package, in document order.
std::vector<std::string> FindRelatedParts(const package::Package& pkg, const std::string& source_part, const char* rel_type);

std::optional<std::string> FindRelatedPart(const package::Package& pkg, const std::string& source_part, const char* rel_type);

// Through _rels/.rels, falling back to the conventional part names.
std::optional<std::string> MainDocumentPart(const package::Package& pkg);
std::optional<std::string> CorePropertiesPart(const package::Package& pkg);
std::optional<std::string> AppPropertiesPart(const package::Package& pkg);

std::optional<std::string> SettingsPart(const package::Package& pkg, const std::string& main_part);

// Headers, footers, footnotes and endnotes referenced by the main part.
std::vector<std::string> StoryParts(const package::Package& pkg, const std::string& main_part);

/*
  EnsureSettingsPart

  Returns the settings part of `main_part`, creating an empty
  <w:settings/> when there is none. A created part is registered with a
  content-type override and a relationship from the main part.
*/
std::string EnsureSettingsPart(package::Package* pkg, const std::string& main_part);

// Adds or replaces the <Override> for `part_name`.
void SetContentTypeOverride(package::Package* pkg, const std::string& part_name, const char* content_type);

// Appends a relationship with a fresh rId and returns the id.
std::string AddRelationship(package::Package* pkg, const std::string& source_part, const char* rel_type, const std::string& target);

} // namespace docrev::ooxml
