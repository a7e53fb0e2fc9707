#include "sanitizer.hpp"

#include <array>
#include <string_view>
#include <utility>
#include <vector>

#include <pugixml.hpp>

#include "internal/observability/logging.hpp"
#include "internal/ooxml/namespaces.hpp"
#include "internal/ooxml/part_locator.hpp"
#include "internal/ooxml/settings.hpp"
#include "internal/ooxml/xml_part.hpp"
#include "internal/util/errors.hpp"

namespace docrev::sanitize {

namespace {

constexpr std::array<std::string_view, 4> kMoveRangeMarkers = {
    "moveFromRangeStart",
    "moveFromRangeEnd",
    "moveToRangeStart",
    "moveToRangeEnd",
};

constexpr std::array<std::string_view, 8> kPropertyChanges = {
    "rPrChange",
    "pPrChange",
    "sectPrChange",
    "tblPrChange",
    "tblGridChange",
    "trPrChange",
    "tcPrChange",
    "numberingChange",
};

template <size_t N>
bool Contains(const std::array<std::string_view, N>& names, std::string_view local) {
  for (auto name : names) {
    if (name == local) return true;
  }
  return false;
}

// A w:tr whose w:trPr carries w:del is a deleted row.
bool IsDeletedRow(const pugi::xml_node& row, const std::string& w) {
  auto props = row.child(ooxml::QName(w, "trPr").c_str());
  return props && props.child(ooxml::QName(w, "del").c_str());
}

void StripRevisions(pugi::xml_node parent, const std::string& w, SanitizeReport* report) {
  auto child = parent.first_child();
  while (child) {
    auto next = child.next_sibling();

    if (child.type() != pugi::node_element || ooxml::Prefix(child) != w) {
      if (child.type() == pugi::node_element) StripRevisions(child, w, report);
      child = next;
      continue;
    }

    const auto local = ooxml::LocalName(child);
    if (local == "del" || local == "moveFrom" || (local == "tr" && IsDeletedRow(child, w))) {
      parent.remove_child(child);
      ++report->removed_deletions;
    } else if (local == "ins" || local == "moveTo") {
      StripRevisions(child, w, report);
      while (auto inner = child.first_child()) {
        parent.insert_move_before(inner, child);
      }
      parent.remove_child(child);
      ++report->unwrapped_insertions;
    } else if (Contains(kMoveRangeMarkers, local) || Contains(kPropertyChanges, local)) {
      parent.remove_child(child);
      ++report->removed_markers;
    } else {
      StripRevisions(child, w, report);
    }

    child = next;
  }
}

// Leaves one empty paragraph followed by the final w:sectPr, if any.
void DropBodyContent(pugi::xml_node body, const std::string& w) {
  const auto sect_name = ooxml::QName(w, "sectPr");

  std::vector<pugi::xml_node> doomed;
  for (auto child : body.children()) {
    if (child == body.last_child() && std::string_view(child.name()) == sect_name) continue;
    doomed.push_back(child);
  }
  for (auto& node : doomed) {
    body.remove_child(node);
  }
  body.prepend_child(ooxml::QName(w, "p").c_str());
}

pugi::xml_node EnsureChild(pugi::xml_node root, const std::string& qname) {
  auto node = root.child(qname.c_str());
  return node ? node : root.append_child(qname.c_str());
}

void SetIfPresent(pugi::xml_node root, const std::string& qname, const std::string& value) {
  for (auto node : root.children(qname.c_str())) {
    ooxml::SetText(node, value);
  }
}

void SetW3CDTF(pugi::xml_node node, const std::string& xsi, const std::string& dcterms, const std::string& value) {
  ooxml::SetText(node, value);
  const auto type_name = ooxml::QName(xsi, "type");
  auto       type      = node.attribute(type_name.c_str());
  if (!type) {
    type = node.append_attribute(type_name.c_str());
  }
  type.set_value(ooxml::QName(dcterms, "W3CDTF").c_str());
}

} // namespace

Sanitizer::Sanitizer(SanitizeOptions options) : options_(std::move(options)) {
}

package::Package Sanitizer::Sanitize(const package::Package& input, util::TimePoint neutral_instant, SanitizeReport* report) const {
  SanitizeReport local_report;
  if (!report) report = &local_report;
  *report = SanitizeReport{};

  const auto main_part = ooxml::MainDocumentPart(input);
  if (!main_part) {
    throw util::MissingRequiredPart("package has no main document part");
  }
  const auto core_part = ooxml::CorePropertiesPart(input);
  if (!core_part) {
    throw util::MissingRequiredPart("package has no core-properties part");
  }

  package::Package out = input;

  out[*main_part] = SanitizeStory(input.at(*main_part), *main_part, true, report);
  for (const auto& part : ooxml::StoryParts(input, *main_part)) {
    out[part] = SanitizeStory(input.at(part), part, false, report);
  }

  if (auto settings = ooxml::SettingsPart(input, *main_part)) {
    out[*settings] = SanitizeSettings(input.at(*settings), *settings, report);
  }

  out[*core_part] = SanitizeCore(input.at(*core_part), *core_part, neutral_instant);
  if (auto app_part = ooxml::AppPropertiesPart(input)) {
    out[*app_part] = SanitizeApp(input.at(*app_part), *app_part);
  }

  DOCREV_LOG_DEBUG("package sanitized", {observability::IntField("unwrapped_insertions", report->unwrapped_insertions),
                                         observability::IntField("removed_deletions", report->removed_deletions),
                                         observability::IntField("removed_markers", report->removed_markers),
                                         observability::IntField("removed_settings", report->removed_settings)});
  return out;
}

std::string Sanitizer::SanitizeStory(const std::string& bytes, const std::string& part_name, bool is_main, SanitizeReport* report) const {
  pugi::xml_document doc;
  ooxml::LoadPart(bytes, part_name, &doc);
  auto root = ooxml::RootElement(doc, part_name);

  const auto w = ooxml::PrefixFor(root, ooxml::kNsW, "w");
  StripRevisions(root, w, report);

  if (is_main && !options_.keep_content) {
    auto body = root.child(ooxml::QName(w, "body").c_str());
    if (!body) {
      throw util::CorruptPackage(part_name + " has no w:body");
    }
    DropBodyContent(body, w);
  }

  return ooxml::SavePart(doc);
}

std::string Sanitizer::SanitizeSettings(const std::string& bytes, const std::string& part_name, SanitizeReport* report) const {
  pugi::xml_document doc;
  ooxml::LoadPart(bytes, part_name, &doc);
  auto settings = ooxml::RootElement(doc, part_name);

  const auto w = ooxml::PrefixFor(settings, ooxml::kNsW, "w");
  report->removed_settings += ooxml::RemoveSetting(settings, w, "trackRevisions");
  report->removed_settings += ooxml::RemoveSetting(settings, w, "revisionView");

  return ooxml::SavePart(doc);
}

std::string Sanitizer::SanitizeCore(const std::string& bytes, const std::string& part_name, util::TimePoint neutral_instant) const {
  pugi::xml_document doc;
  ooxml::LoadPart(bytes, part_name, &doc);
  auto root = ooxml::RootElement(doc, part_name);

  const auto cp      = ooxml::EnsureNamespace(root, ooxml::kNsCp, "cp");
  const auto dc      = ooxml::EnsureNamespace(root, ooxml::kNsDc, "dc");
  const auto dcterms = ooxml::EnsureNamespace(root, ooxml::kNsDcTerms, "dcterms");
  const auto xsi     = ooxml::EnsureNamespace(root, ooxml::kNsXsi, "xsi");

  const auto author  = ooxml::CleanAuthor(options_.neutral_author);
  const auto instant = util::FormatW3CDTF(neutral_instant);

  ooxml::SetText(EnsureChild(root, ooxml::QName(dc, "creator")), author);
  ooxml::SetText(EnsureChild(root, ooxml::QName(cp, "lastModifiedBy")), author);

  SetIfPresent(root, ooxml::QName(dc, "title"), "");
  SetIfPresent(root, ooxml::QName(dc, "subject"), "");
  SetIfPresent(root, ooxml::QName(dc, "description"), "");
  SetIfPresent(root, ooxml::QName(cp, "keywords"), "");

  ooxml::SetText(EnsureChild(root, ooxml::QName(cp, "revision")), "1");

  SetW3CDTF(EnsureChild(root, ooxml::QName(dcterms, "created")), xsi, dcterms, instant);
  SetW3CDTF(EnsureChild(root, ooxml::QName(dcterms, "modified")), xsi, dcterms, instant);
  SetIfPresent(root, ooxml::QName(cp, "lastPrinted"), instant);

  return ooxml::SavePart(doc);
}

std::string Sanitizer::SanitizeApp(const std::string& bytes, const std::string& part_name) const {
  pugi::xml_document doc;
  ooxml::LoadPart(bytes, part_name, &doc);
  auto root = ooxml::RootElement(doc, part_name);

  const auto ep = ooxml::PrefixFor(root, ooxml::kNsExtendedProps, "");

  for (const char* field : {"Company", "Manager", "AppVersion", "HyperlinkBase"}) {
    SetIfPresent(root, ooxml::QName(ep, field), "");
  }
  ooxml::SetText(EnsureChild(root, ooxml::QName(ep, "Application")), ooxml::StripInvalidXmlChars(options_.application_name));
  ooxml::SetText(EnsureChild(root, ooxml::QName(ep, "TotalTime")), "0");
  ooxml::SetText(EnsureChild(root, ooxml::QName(ep, "Template")), "Normal.dotm");

  return ooxml::SavePart(doc);
}

} // namespace docrev::sanitize
