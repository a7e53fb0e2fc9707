#include "settings.hpp"

#include <array>
#include <vector>

#include "internal/ooxml/xml_part.hpp"

namespace docrev::ooxml {

namespace {

// CT_Settings sequence up to trackRevisions. Anything not listed sorts after.
constexpr std::array<std::string_view, 32> kSettingsOrder = {
    "writeProtection",
    "view",
    "zoom",
    "removePersonalInformation",
    "removeDateAndTime",
    "doNotDisplayPageBoundaries",
    "displayBackgroundShape",
    "printPostScriptOverText",
    "printFractionalCharacterWidth",
    "printFormsData",
    "embedTrueTypeFonts",
    "embedSystemFonts",
    "saveSubsetFonts",
    "saveFormsData",
    "mirrorMargins",
    "alignBordersAndEdges",
    "bordersDoNotSurroundHeader",
    "bordersDoNotSurroundFooter",
    "gutterAtTop",
    "hideSpellingErrors",
    "hideGrammaticalErrors",
    "activeWritingStyle",
    "proofState",
    "formsDesign",
    "attachedTemplate",
    "linkStyles",
    "stylePaneFormatFilter",
    "stylePaneSortMethod",
    "documentType",
    "mailMerge",
    "revisionView",
    "trackRevisions",
};

constexpr size_t kUnordered = kSettingsOrder.size();

size_t OrderOf(std::string_view local) {
  for (size_t i = 0; i < kSettingsOrder.size(); ++i) {
    if (kSettingsOrder[i] == local) {
      return i;
    }
  }
  return kUnordered;
}

} // namespace

pugi::xml_node EnsureSetting(pugi::xml_node settings, const std::string& prefix, std::string_view local) {
  const auto qname  = QName(prefix, local);
  auto       exists = settings.child(qname.c_str());
  if (exists) {
    return exists;
  }

  const size_t   rank = OrderOf(local);
  pugi::xml_node after;
  for (auto child : settings.children()) {
    if (child.type() != pugi::node_element || Prefix(child) != prefix) {
      continue;
    }
    if (OrderOf(LocalName(child)) < rank) {
      after = child;
    }
  }

  if (after) {
    return settings.insert_child_after(qname.c_str(), after);
  }
  return settings.prepend_child(qname.c_str());
}

int RemoveSetting(pugi::xml_node settings, const std::string& prefix, std::string_view local) {
  const auto                  qname = QName(prefix, local);
  std::vector<pugi::xml_node> doomed;
  for (auto child : settings.children(qname.c_str())) {
    doomed.push_back(child);
  }
  for (auto& node : doomed) {
    settings.remove_child(node);
  }
  return static_cast<int>(doomed.size());
}

void SetTrackRevisions(pugi::xml_node settings, const std::string& prefix, bool enabled) {
  if (!enabled) {
    RemoveSetting(settings, prefix, "trackRevisions");
    return;
  }
  auto node = EnsureSetting(settings, prefix, "trackRevisions");
  // A bare element means "on"; drop any w:val="false" left by another writer.
  node.remove_attribute(QName(prefix, "val").c_str());
}

void SetAcceptedRevisionView(pugi::xml_node settings, const std::string& prefix, bool accepted) {
  if (!accepted) {
    RemoveSetting(settings, prefix, "revisionView");
    return;
  }

  auto node = EnsureSetting(settings, prefix, "revisionView");
  for (const char* local : {"markup", "insDel"}) {
    const auto name = QName(prefix, local);
    auto       attr = node.attribute(name.c_str());
    if (!attr) {
      attr = node.append_attribute(name.c_str());
    }
    attr.set_value("0");
  }
}

} // namespace docrev::ooxml
