#pragma once

#include <string>
#include <string_view>

#include <pugixml.hpp>

namespace docrev::ooxml {

/*
  Edits on the w:settings element.

  CT_Settings is a strict sequence; Word refuses a settings part whose
  children are out of order. New elements are therefore placed after the
  last existing sibling that precedes them in the schema, or first when
  there is none.
*/

// Returns the existing child or creates one at its schema position.
pugi::xml_node EnsureSetting(pugi::xml_node settings, const std::string& prefix, std::string_view local);

// Removes every child named `local`; returns how many were removed.
int RemoveSetting(pugi::xml_node settings, const std::string& prefix, std::string_view local);

// <w:trackRevisions/> on or off.
void SetTrackRevisions(pugi::xml_node settings, const std::string& prefix, bool enabled);

// <w:revisionView w:markup="0" w:insDel="0"/> when `accepted`, removed otherwise.
void SetAcceptedRevisionView(pugi::xml_node settings, const std::string& prefix, bool accepted);

} // namespace docrev::ooxml
