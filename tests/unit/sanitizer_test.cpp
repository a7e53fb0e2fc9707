#include "internal/sanitize/sanitizer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include "internal/builder/document_builder.hpp"
#include "internal/ooxml/xml_part.hpp"
#include "internal/revision/revision_injector.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using docrev::package::Package;
using docrev::sanitize::SanitizeOptions;
using docrev::sanitize::SanitizeReport;
using docrev::sanitize::Sanitizer;
using docrev::util::ParseTimestamp;

const auto kNeutral = ParseTimestamp("2000-01-01T00:00:00Z");

Package TrackedPackage(docrev::model::RenderMode mode) {
  std::vector<docrev::db::model::SentenceRecord> records(3);
  const char* texts[] = {"One.", "Two.", "Three."};
  for (uint32_t i = 0; i < 3; ++i) {
    records[i].position    = i;
    records[i].text        = texts[i];
    records[i].created_at  = ParseTimestamp("2024-01-01T10:00:00Z") + std::chrono::minutes(i);
    records[i].modified_at = records[i].created_at;
    records[i].revision_id = i + 1;
    records[i].author      = "Jane Doe";
  }

  docrev::model::DocumentProperties props;
  props.title = "Secret plan";

  const auto baseline = docrev::builder::DocumentBuilder().Build(records, props, "Jane Doe");
  return docrev::revision::RevisionInjector().Inject(baseline, records, mode);
}

constexpr const char* kMixedBody =
    R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body>)"
    R"(<w:p><w:ins w:id="1" w:author="A" w:date="2024-01-01T00:00:00Z"><w:r><w:t>kept</w:t></w:r></w:ins>)"
    R"(<w:del w:id="2" w:author="A" w:date="2024-01-01T00:00:00Z"><w:r><w:delText>gone</w:delText></w:r></w:del></w:p>)"
    R"(<w:p><w:moveFromRangeStart w:id="3" w:name="m"/><w:moveFrom w:id="4"><w:r><w:t>old place</w:t></w:r></w:moveFrom>)"
    R"(<w:moveFromRangeEnd w:id="3"/></w:p>)"
    R"(<w:p><w:pPr><w:pPrChange w:id="5"><w:pPr/></w:pPrChange></w:pPr><w:moveToRangeStart w:id="6" w:name="m"/>)"
    R"(<w:moveTo w:id="7"><w:r><w:rPr><w:b/><w:rPrChange w:id="8"><w:rPr/></w:rPrChange></w:rPr><w:t>new place</w:t></w:r></w:moveTo>)"
    R"(<w:moveToRangeEnd w:id="6"/></w:p>)"
    R"(<w:tbl><w:tr><w:tc><w:p/></w:tc></w:tr><w:tr><w:trPr><w:del w:id="9"/></w:trPr><w:tc><w:p/></w:tc></w:tr></w:tbl>)"
    R"(<w:sectPr/></w:body></w:document>)";

std::string CoreText(const Package& pkg, const char* qname) {
  pugi::xml_document doc;
  docrev::ooxml::LoadPart(pkg.at("docProps/core.xml"), "docProps/core.xml", &doc);
  return doc.document_element().child(qname).text().get();
}

void TestScenarioLeavesPlainParagraphs() {
  const auto input = TrackedPackage(docrev::model::RenderMode::kSuggestions);

  SanitizeReport report;
  const auto     out = Sanitizer().Sanitize(input, kNeutral, &report);

  assert(report.unwrapped_insertions == 3);
  assert(report.removed_settings == 1);

  pugi::xml_document doc;
  docrev::ooxml::LoadPart(out.at("word/document.xml"), "word/document.xml", &doc);
  size_t paragraphs = 0;
  for (auto p : doc.document_element().child("w:body").children("w:p")) {
    assert(std::string(p.first_child().name()) == "w:r");
    ++paragraphs;
  }
  assert(paragraphs == 3);

  for (const auto& [name, bytes] : out) {
    assert(bytes.find("Jane Doe") == std::string::npos);
    assert(bytes.find("w:ins") == std::string::npos);
    (void)name;
  }
  assert(out.at("word/settings.xml").find("trackRevisions") == std::string::npos);

  assert(CoreText(out, "dc:creator") == "Anonymous");
  assert(CoreText(out, "cp:lastModifiedBy") == "Anonymous");
  assert(CoreText(out, "dc:title").empty());
  assert(CoreText(out, "cp:revision") == "1");
  assert(CoreText(out, "dcterms:created") == "2000-01-01T00:00:00Z");
  assert(CoreText(out, "dcterms:created") == CoreText(out, "dcterms:modified"));
}

void TestSanitizeIsIdempotent() {
  const auto input = TrackedPackage(docrev::model::RenderMode::kFinal);

  Sanitizer      sanitizer;
  const auto     once = sanitizer.Sanitize(input, kNeutral);
  SanitizeReport report;
  const auto     twice = sanitizer.Sanitize(once, kNeutral, &report);

  assert(once == twice);
  assert(report.unwrapped_insertions == 0);
  assert(report.removed_deletions == 0);
  assert(report.removed_markers == 0);
  assert(report.removed_settings == 0);
  assert(input.at("word/settings.xml").find("revisionView") != std::string::npos);
  assert(once.at("word/settings.xml").find("revisionView") == std::string::npos);
}

void TestDeletionsAndMovesResolved() {
  auto pkg                 = TrackedPackage(docrev::model::RenderMode::kClean);
  pkg["word/document.xml"] = kMixedBody;

  SanitizeReport report;
  const auto     out  = Sanitizer().Sanitize(pkg, kNeutral, &report);
  const auto&    body = out.at("word/document.xml");

  assert(body.find("kept") != std::string::npos);
  assert(body.find("gone") == std::string::npos);
  assert(body.find("old place") == std::string::npos);
  assert(body.find("new place") != std::string::npos);
  assert(body.find("<w:b") != std::string::npos);
  for (const char* marker : {"w:ins", "w:del", "w:moveFrom", "w:moveTo", "RangeStart", "RangeEnd", "PrChange"}) {
    assert(body.find(marker) == std::string::npos);
  }

  pugi::xml_document doc;
  docrev::ooxml::LoadPart(body, "word/document.xml", &doc);
  size_t rows = 0;
  for (auto tr : doc.document_element().child("w:body").child("w:tbl").children("w:tr")) {
    (void)tr;
    ++rows;
  }
  assert(rows == 1);

  assert(report.unwrapped_insertions == 2);
  assert(report.removed_deletions == 3);
  assert(report.removed_markers == 6);
}

void TestDropContentKeepsSection() {
  SanitizeOptions options;
  options.keep_content   = false;
  options.neutral_author = "Nobody";

  const auto out = Sanitizer(options).Sanitize(TrackedPackage(docrev::model::RenderMode::kFinal), kNeutral);

  pugi::xml_document doc;
  docrev::ooxml::LoadPart(out.at("word/document.xml"), "word/document.xml", &doc);
  auto body = doc.document_element().child("w:body");

  assert(std::string(body.first_child().name()) == "w:p");
  assert(!body.first_child().first_child());
  assert(std::string(body.last_child().name()) == "w:sectPr");
  assert(body.first_child().next_sibling() == body.last_child());
  assert(out.at("word/document.xml").find("One.") == std::string::npos);
  assert(CoreText(out, "dc:creator") == "Nobody");
}

void TestAppPropertiesNeutralized() {
  auto pkg = TrackedPackage(docrev::model::RenderMode::kFinal);
  pkg["docProps/app.xml"] =
      R"(<Properties xmlns="http://schemas.openxmlformats.org/officeDocument/2006/extended-properties">)"
      R"(<TotalTime>913</TotalTime><Company>Acme Corp</Company><Manager>Boss</Manager><AppVersion>16.0000</AppVersion>)"
      R"(</Properties>)";

  const auto  out = Sanitizer().Sanitize(pkg, kNeutral);
  const auto& app = out.at("docProps/app.xml");

  assert(app.find("Acme") == std::string::npos);
  assert(app.find("Boss") == std::string::npos);
  assert(app.find("<TotalTime>0</TotalTime>") != std::string::npos);
  assert(app.find("<Template>Normal.dotm</Template>") != std::string::npos);
  assert(app.find("<Application>Microsoft Office Word</Application>") != std::string::npos);
}

void TestMissingCorePart() {
  auto pkg = TrackedPackage(docrev::model::RenderMode::kFinal);
  pkg.erase("docProps/core.xml");

  bool threw = false;
  try {
    (void)Sanitizer().Sanitize(pkg, kNeutral);
  } catch (const docrev::util::MissingRequiredPart&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScenarioLeavesPlainParagraphs();
  TestSanitizeIsIdempotent();
  TestDeletionsAndMovesResolved();
  TestDropContentKeepsSection();
  TestAppPropertiesNeutralized();
  TestMissingCorePart();

  std::cout << "docrev_unit_sanitizer: pass\n";
  return 0;
}
