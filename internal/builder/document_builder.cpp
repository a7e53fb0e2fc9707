#include "document_builder.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <pugixml.hpp>

#include "internal/ooxml/namespaces.hpp"
#include "internal/ooxml/xml_part.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docrev::builder {

namespace {

// ------------------------------------------------------------------
// Static parts
// ------------------------------------------------------------------

constexpr const char* kContentTypesXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
    R"(<Default Extension="xml" ContentType="application/xml"/>)"
    R"(<Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>)"
    R"(<Override PartName="/word/styles.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml"/>)"
    R"(<Override PartName="/word/settings.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.settings+xml"/>)"
    R"(<Override PartName="/docProps/core.xml" ContentType="application/vnd.openxmlformats-package.core-properties+xml"/>)"
    R"(<Override PartName="/docProps/app.xml" ContentType="application/vnd.openxmlformats-officedocument.extended-properties+xml"/>)"
    R"(</Types>)";

constexpr const char* kRootRelsXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>)"
    R"(<Relationship Id="rId2" Type="http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties" Target="docProps/core.xml"/>)"
    R"(<Relationship Id="rId3" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties" Target="docProps/app.xml"/>)"
    R"(</Relationships>)";

constexpr const char* kDocumentRelsXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles" Target="styles.xml"/>)"
    R"(<Relationship Id="rId2" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/settings" Target="settings.xml"/>)"
    R"(</Relationships>)";

constexpr const char* kStylesXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:docDefaults>)"
    R"(<w:rPrDefault><w:rPr>)"
    R"(<w:rFonts w:ascii="Calibri" w:eastAsia="Calibri" w:hAnsi="Calibri" w:cs="Times New Roman"/>)"
    R"(<w:sz w:val="22"/><w:szCs w:val="22"/><w:lang w:val="en-US" w:eastAsia="en-US" w:bidi="ar-SA"/>)"
    R"(</w:rPr></w:rPrDefault>)"
    R"(<w:pPrDefault><w:pPr><w:spacing w:after="160" w:line="259" w:lineRule="auto"/></w:pPr></w:pPrDefault>)"
    R"(</w:docDefaults>)"
    R"(<w:style w:type="paragraph" w:default="1" w:styleId="Normal"><w:name w:val="Normal"/><w:qFormat/></w:style>)"
    R"(<w:style w:type="character" w:default="1" w:styleId="DefaultParagraphFont"><w:name w:val="Default Paragraph Font"/>)"
    R"(<w:uiPriority w:val="1"/><w:semiHidden/><w:unhideWhenUsed/></w:style>)"
    R"(</w:styles>)";

constexpr const char* kSettingsXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:zoom w:percent="100"/>)"
    R"(<w:defaultTabStop w:val="720"/>)"
    R"(<w:characterSpacingControl w:val="doNotCompress"/>)"
    R"(<w:compat><w:compatSetting w:name="compatibilityMode" w:uri="http://schemas.microsoft.com/office/word" w:val="15"/></w:compat>)"
    R"(</w:settings>)";

// US Letter, 1" margins (twentieths of a point).
constexpr const char* kPageWidth    = "12240";
constexpr const char* kPageHeight   = "15840";
constexpr const char* kMargin       = "1440";
constexpr const char* kHeaderFooter = "720";

// Rough page geometry for the app.xml statistics.
constexpr uint32_t kCharsPerLine = 90;
constexpr uint32_t kLinesPerPage = 46;

struct TextStats {
  uint32_t words                  = 0;
  uint32_t characters             = 0; // non-whitespace code points
  uint32_t characters_with_spaces = 0;
  uint32_t lines                  = 0;
};

bool IsAsciiSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool IsContinuationByte(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

TextStats CountText(const std::vector<db::model::SentenceRecord>& records) {
  TextStats stats;
  for (size_t i = 0; i < records.size(); ++i) {
    uint32_t paragraph_chars = 0;
    bool     in_word         = false;
    for (unsigned char c : records[i].text) {
      if (IsContinuationByte(c)) continue;
      ++paragraph_chars;
      if (IsAsciiSpace(c)) {
        in_word = false;
        continue;
      }
      ++stats.characters;
      if (!in_word) {
        ++stats.words;
        in_word = true;
      }
    }
    // Separator run between sentences.
    if (i + 1 < records.size()) ++paragraph_chars;

    stats.characters_with_spaces += paragraph_chars;
    stats.lines += std::max<uint32_t>(1, (paragraph_chars + kCharsPerLine - 1) / kCharsPerLine);
  }
  return stats;
}

pugi::xml_node AppendText(pugi::xml_node parent, const char* name, const std::string& value) {
  auto node = parent.append_child(name);
  if (!value.empty()) {
    node.text().set(value.c_str());
  }
  return node;
}

void AppendRun(pugi::xml_node paragraph, const std::string& text) {
  auto t = paragraph.append_child("w:r").append_child("w:t");
  if (!text.empty() && (IsAsciiSpace(text.front()) || IsAsciiSpace(text.back()))) {
    t.append_attribute("xml:space").set_value("preserve");
  }
  t.text().set(text.c_str());
}

void AppendSectionProperties(pugi::xml_node body) {
  auto sect = body.append_child("w:sectPr");

  auto size = sect.append_child("w:pgSz");
  size.append_attribute("w:w").set_value(kPageWidth);
  size.append_attribute("w:h").set_value(kPageHeight);

  auto margins = sect.append_child("w:pgMar");
  for (const char* side : {"w:top", "w:right", "w:bottom", "w:left"}) {
    margins.append_attribute(side).set_value(kMargin);
  }
  margins.append_attribute("w:header").set_value(kHeaderFooter);
  margins.append_attribute("w:footer").set_value(kHeaderFooter);
  margins.append_attribute("w:gutter").set_value("0");

  sect.append_child("w:cols").append_attribute("w:space").set_value(kHeaderFooter);
  sect.append_child("w:docGrid").append_attribute("w:linePitch").set_value("360");
}

} // namespace

DocumentBuilder::DocumentBuilder(BuilderOptions options) : options_(std::move(options)) {
}

package::Package DocumentBuilder::Build(const std::vector<db::model::SentenceRecord>& records,
                                        const model::DocumentProperties& properties, const std::string& author) const {
  if (records.empty()) {
    throw util::EmptyDocument("cannot build a document without sentences");
  }

  package::Package pkg;
  pkg[ooxml::kPartContentTypes] = kContentTypesXml;
  pkg[ooxml::kPartRootRels]     = kRootRelsXml;
  pkg[ooxml::kPartDocument]     = DocumentXml(records);
  pkg[ooxml::kPartDocumentRels] = kDocumentRelsXml;
  pkg[ooxml::kPartStyles]       = kStylesXml;
  pkg[ooxml::kPartSettings]     = kSettingsXml;
  pkg[ooxml::kPartCore]         = CoreXml(records, properties, author);
  pkg[ooxml::kPartApp]          = AppXml(records, properties);
  return pkg;
}

std::string DocumentBuilder::DocumentXml(const std::vector<db::model::SentenceRecord>& records) const {
  pugi::xml_document doc;
  auto               root = doc.append_child("w:document");
  root.append_attribute("xmlns:w").set_value(ooxml::kNsW);
  root.append_attribute("xmlns:r").set_value(ooxml::kNsR);

  auto body = root.append_child("w:body");
  for (size_t i = 0; i < records.size(); ++i) {
    auto paragraph = body.append_child("w:p");
    AppendRun(paragraph, ooxml::StripInvalidXmlChars(records[i].text));
    if (i + 1 < records.size()) {
      AppendRun(paragraph, " ");
    }
  }
  AppendSectionProperties(body);

  return ooxml::SavePart(doc);
}

std::string DocumentBuilder::CoreXml(const std::vector<db::model::SentenceRecord>& records, const model::DocumentProperties& properties,
                                     const std::string& author) const {
  const auto creator          = ooxml::CleanAuthor(author);
  const auto last_modified_by = options_.last_modified_by.empty() ? creator : ooxml::CleanAuthor(options_.last_modified_by);

  util::TimePoint modified = records.front().modified_at;
  for (const auto& record : records) {
    modified = std::max(modified, record.modified_at);
  }

  pugi::xml_document doc;
  auto               root = doc.append_child("cp:coreProperties");
  root.append_attribute("xmlns:cp").set_value(ooxml::kNsCp);
  root.append_attribute("xmlns:dc").set_value(ooxml::kNsDc);
  root.append_attribute("xmlns:dcterms").set_value(ooxml::kNsDcTerms);
  root.append_attribute("xmlns:dcmitype").set_value(ooxml::kNsDcmiType);
  root.append_attribute("xmlns:xsi").set_value(ooxml::kNsXsi);

  if (properties.title) AppendText(root, "dc:title", ooxml::StripInvalidXmlChars(*properties.title));
  if (properties.subject) AppendText(root, "dc:subject", ooxml::StripInvalidXmlChars(*properties.subject));
  AppendText(root, "dc:creator", creator);
  if (properties.keywords) AppendText(root, "cp:keywords", ooxml::StripInvalidXmlChars(*properties.keywords));
  if (properties.comments) AppendText(root, "dc:description", ooxml::StripInvalidXmlChars(*properties.comments));
  AppendText(root, "cp:lastModifiedBy", last_modified_by);
  AppendText(root, "cp:revision", "1");

  auto created_node = AppendText(root, "dcterms:created", util::FormatW3CDTF(records.front().created_at));
  created_node.append_attribute("xsi:type").set_value("dcterms:W3CDTF");
  auto modified_node = AppendText(root, "dcterms:modified", util::FormatW3CDTF(modified));
  modified_node.append_attribute("xsi:type").set_value("dcterms:W3CDTF");

  return ooxml::SavePart(doc);
}

std::string DocumentBuilder::AppXml(const std::vector<db::model::SentenceRecord>& records,
                                    const model::DocumentProperties& properties) const {
  const auto stats = CountText(records);
  const auto pages = std::max<uint32_t>(1, (stats.lines + kLinesPerPage - 1) / kLinesPerPage);

  pugi::xml_document doc;
  auto               root = doc.append_child("Properties");
  root.append_attribute("xmlns").set_value(ooxml::kNsExtendedProps);
  root.append_attribute("xmlns:vt").set_value(ooxml::kNsDocPropsVTypes);

  AppendText(root, "Template", "Normal.dotm");
  AppendText(root, "TotalTime", std::to_string(properties.total_edit_time_minutes.value_or(0)));
  AppendText(root, "Pages", std::to_string(pages));
  AppendText(root, "Words", std::to_string(stats.words));
  AppendText(root, "Characters", std::to_string(stats.characters));
  AppendText(root, "Application", ooxml::StripInvalidXmlChars(options_.application_name));
  AppendText(root, "DocSecurity", "0");
  AppendText(root, "Lines", std::to_string(stats.lines));
  AppendText(root, "Paragraphs", std::to_string(records.size()));
  AppendText(root, "ScaleCrop", "false");
  AppendText(root, "Company", "");
  AppendText(root, "LinksUpToDate", "false");
  AppendText(root, "CharactersWithSpaces", std::to_string(stats.characters_with_spaces));
  AppendText(root, "SharedDoc", "false");
  AppendText(root, "HyperlinksChanged", "false");
  AppendText(root, "AppVersion", ooxml::StripInvalidXmlChars(options_.app_version));

  return ooxml::SavePart(doc);
}

} // namespace docrev::builder
