#include "part_locator.hpp"

#include <cstring>
#include <set>
#include <utility>
#include <vector>

#include <pugixml.hpp>

#include "internal/ooxml/namespaces.hpp"
#include "internal/ooxml/xml_part.hpp"
#include "internal/util/errors.hpp"

namespace docrev::ooxml {

namespace {

constexpr const char* kEmptyRels = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
                                   R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships"/>)";

constexpr const char* kEmptySettings = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
                                       R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"/>)";

std::string Directory(const std::string& part) {
  const auto slash = part.rfind('/');
  return slash == std::string::npos ? std::string{} : part.substr(0, slash);
}

std::string Normalize(const std::string& path) {
  std::vector<std::string> segments;
  size_t                   begin = 0;
  while (begin <= path.size()) {
    auto end = path.find('/', begin);
    if (end == std::string::npos) end = path.size();

    const auto segment = path.substr(begin, end - begin);
    if (segment == "..") {
      if (!segments.empty()) segments.pop_back();
    } else if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    begin = end + 1;
  }

  std::string out;
  for (const auto& segment : segments) {
    if (!out.empty()) out += '/';
    out += segment;
  }
  return out;
}

std::optional<std::string> PartOrFallback(const package::Package& pkg, const char* rel_type, const char* fallback) {
  if (auto part = FindRelatedPart(pkg, "", rel_type)) {
    return part;
  }
  if (pkg.count(fallback) != 0) {
    return std::string(fallback);
  }
  return std::nullopt;
}

// A new .rels part needs the "rels" extension default to be typed.
void EnsureRelsDefault(package::Package* pkg) {
  auto it = pkg->find(kPartContentTypes);
  if (it == pkg->end()) {
    throw util::MissingRequiredPart(std::string(kPartContentTypes) + " is missing");
  }

  pugi::xml_document doc;
  LoadPart(it->second, kPartContentTypes, &doc);
  auto root = RootElement(doc, kPartContentTypes);

  const auto prefix = PrefixFor(root, kNsContentTypes, "");
  for (auto child : root.children()) {
    if (Is(child, prefix, "Default") && std::strcmp(child.attribute("Extension").value(), "rels") == 0) {
      return;
    }
  }

  auto node = root.prepend_child(QName(prefix, "Default").c_str());
  node.append_attribute("Extension").set_value("rels");
  node.append_attribute("ContentType").set_value(kCtRelationships);
  it->second = SavePart(doc);
}

} // namespace

std::string RelsPartName(const std::string& source_part) {
  if (source_part.empty()) {
    return kPartRootRels;
  }
  const auto dir  = Directory(source_part);
  const auto name = dir.empty() ? source_part : source_part.substr(dir.size() + 1);
  return dir.empty() ? "_rels/" + name + ".rels" : dir + "/_rels/" + name + ".rels";
}

std::string ResolveTarget(const std::string& source_part, const std::string& target) {
  if (!target.empty() && target.front() == '/') {
    return Normalize(target);
  }
  const auto dir = Directory(source_part);
  return Normalize(dir.empty() ? target : dir + "/" + target);
}

std::vector<std::string> FindRelatedParts(const package::Package& pkg, const std::string& source_part, const char* rel_type) {
  std::vector<std::string> parts;

  const auto rels_name = RelsPartName(source_part);
  const auto it        = pkg.find(rels_name);
  if (it == pkg.end()) {
    return parts;
  }

  pugi::xml_document doc;
  LoadPart(it->second, rels_name, &doc);

  for (auto rel : RootElement(doc, rels_name).children()) {
    if (LocalName(rel) != "Relationship") continue;
    if (std::strcmp(rel.attribute("Type").value(), rel_type) != 0) continue;
    if (std::strcmp(rel.attribute("TargetMode").value(), "External") == 0) continue;

    auto resolved = ResolveTarget(source_part, rel.attribute("Target").value());
    if (pkg.count(resolved) != 0) {
      parts.push_back(std::move(resolved));
    }
  }
  return parts;
}

std::optional<std::string> FindRelatedPart(const package::Package& pkg, const std::string& source_part, const char* rel_type) {
  auto parts = FindRelatedParts(pkg, source_part, rel_type);
  if (parts.empty()) {
    return std::nullopt;
  }
  return parts.front();
}

std::optional<std::string> MainDocumentPart(const package::Package& pkg) {
  return PartOrFallback(pkg, kRelOfficeDocument, kPartDocument);
}

std::optional<std::string> CorePropertiesPart(const package::Package& pkg) {
  return PartOrFallback(pkg, kRelCoreProperties, kPartCore);
}

std::optional<std::string> AppPropertiesPart(const package::Package& pkg) {
  return PartOrFallback(pkg, kRelExtendedProperties, kPartApp);
}

std::optional<std::string> SettingsPart(const package::Package& pkg, const std::string& main_part) {
  return FindRelatedPart(pkg, main_part, kRelSettings);
}

std::vector<std::string> StoryParts(const package::Package& pkg, const std::string& main_part) {
  std::vector<std::string> parts;
  std::set<std::string>    seen;
  for (const char* type : {kRelHeader, kRelFooter, kRelFootnotes, kRelEndnotes}) {
    for (auto& part : FindRelatedParts(pkg, main_part, type)) {
      if (seen.insert(part).second) {
        parts.push_back(std::move(part));
      }
    }
  }
  return parts;
}

std::string EnsureSettingsPart(package::Package* pkg, const std::string& main_part) {
  if (auto existing = SettingsPart(*pkg, main_part)) {
    return *existing;
  }

  const auto dir  = Directory(main_part);
  auto       name = dir.empty() ? std::string("settings.xml") : dir + "/settings.xml";
  if (pkg->count(name) != 0) {
    // Present but unreferenced: take it over rather than shadow it.
    AddRelationship(pkg, main_part, kRelSettings, "settings.xml");
    SetContentTypeOverride(pkg, name, kCtSettings);
    return name;
  }

  (*pkg)[name] = kEmptySettings;
  SetContentTypeOverride(pkg, name, kCtSettings);
  AddRelationship(pkg, main_part, kRelSettings, "settings.xml");
  return name;
}

void SetContentTypeOverride(package::Package* pkg, const std::string& part_name, const char* content_type) {
  auto it = pkg->find(kPartContentTypes);
  if (it == pkg->end()) {
    throw util::MissingRequiredPart(std::string(kPartContentTypes) + " is missing");
  }

  pugi::xml_document doc;
  LoadPart(it->second, kPartContentTypes, &doc);
  auto root = RootElement(doc, kPartContentTypes);

  const auto prefix    = PrefixFor(root, kNsContentTypes, "");
  const auto part_attr = "/" + part_name;

  pugi::xml_node override_node;
  for (auto child : root.children()) {
    if (Is(child, prefix, "Override") && part_attr == child.attribute("PartName").value()) {
      override_node = child;
      break;
    }
  }
  if (!override_node) {
    override_node = root.append_child(QName(prefix, "Override").c_str());
    override_node.append_attribute("PartName").set_value(part_attr.c_str());
    override_node.append_attribute("ContentType");
  }
  override_node.attribute("ContentType").set_value(content_type);

  it->second = SavePart(doc);
}

std::string AddRelationship(package::Package* pkg, const std::string& source_part, const char* rel_type, const std::string& target) {
  const auto rels_name = RelsPartName(source_part);
  auto       it        = pkg->find(rels_name);
  if (it == pkg->end()) {
    it = pkg->emplace(rels_name, kEmptyRels).first;
    EnsureRelsDefault(pkg);
  }

  pugi::xml_document doc;
  LoadPart(it->second, rels_name, &doc);
  auto root = RootElement(doc, rels_name);

  std::set<std::string> taken;
  for (auto rel : root.children()) {
    taken.insert(rel.attribute("Id").value());
  }
  int         n = 1;
  std::string id;
  do {
    id = "rId" + std::to_string(n++);
  } while (taken.count(id) != 0);

  const auto prefix = PrefixFor(root, kNsPackageRels, "");
  auto       rel    = root.append_child(QName(prefix, "Relationship").c_str());
  rel.append_attribute("Id").set_value(id.c_str());
  rel.append_attribute("Type").set_value(rel_type);
  rel.append_attribute("Target").set_value(target.c_str());

  it->second = SavePart(doc);
  return id;
}

} // namespace docrev::ooxml
