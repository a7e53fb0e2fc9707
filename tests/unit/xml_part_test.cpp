#include "internal/ooxml/xml_part.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/ooxml/namespaces.hpp"
#include "internal/ooxml/settings.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace docrev::ooxml;

void TestStripInvalidXmlChars() {
  assert(StripInvalidXmlChars("plain") == "plain");
  assert(StripInvalidXmlChars(std::string("a\x01" "b\x0b" "c", 5)) == "abc");
  assert(StripInvalidXmlChars("tab\there\nnewline") == "tab\there\nnewline");

  // U+00E9 survives, a lone continuation byte and a truncated sequence do not.
  assert(StripInvalidXmlChars("caf\xc3\xa9") == "caf\xc3\xa9");
  assert(StripInvalidXmlChars("x\x80y") == "xy");
  assert(StripInvalidXmlChars("end\xe2\x82") == "end");

  // Encoded surrogate (U+D800) is not a scalar value.
  assert(StripInvalidXmlChars("s\xed\xa0\x80t") == "st");
}

void TestTruncateCountsCodePoints() {
  assert(TruncateCodePoints("abcdef", 3) == "abc");
  assert(TruncateCodePoints("\xc3\xa9\xc3\xa9\xc3\xa9", 2) == "\xc3\xa9\xc3\xa9");
  assert(TruncateCodePoints("ab", 10) == "ab");

  const std::string long_author(400, 'x');
  assert(CleanAuthor(long_author).size() == kMaxAuthorLength);
  assert(CleanAuthor(std::string("Jane\x02 Doe")) == "Jane Doe");
}

void TestPrefixLookup() {
  pugi::xml_document doc;
  LoadPart(R"(<x:document xmlns:x="http://schemas.openxmlformats.org/wordprocessingml/2006/main"/>)",
           "word/document.xml", &doc);

  const auto root = RootElement(doc, "word/document.xml");
  assert(PrefixFor(root, kNsW, "w") == "x");
  assert(!FindPrefix(root, kNsR).has_value());
  assert(PrefixFor(root, kNsR, "r") == "r");

  assert(EnsureNamespace(root, kNsR, "r") == "r");
  assert(FindPrefix(root, kNsR) == std::string("r"));
  assert(EnsureNamespace(root, kNsW, "w") == "x");

  assert(QName("x", "p") == "x:p");
  assert(QName("", "p") == "p");
}

void TestSaveWritesStandaloneDeclaration() {
  pugi::xml_document doc;
  LoadPart("<root><t xml:space=\"preserve\"> </t></root>", "part.xml", &doc);

  const std::string out = SavePart(doc);
  assert(out.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>", 0) == 0);
  // Whitespace-only text is kept.
  assert(out.find("<t xml:space=\"preserve\"> </t>") != std::string::npos);
}

void TestMalformedPartIsCorrupt() {
  pugi::xml_document doc;
  bool               threw = false;
  try {
    LoadPart("<root><open></root>", "word/document.xml", &doc);
  } catch (const docrev::util::CorruptPackage& e) {
    threw = std::string(e.what()).find("word/document.xml") != std::string::npos;
  }
  assert(threw);
}

void TestSettingsKeepSchemaOrder() {
  pugi::xml_document doc;
  LoadPart(std::string("<w:settings xmlns:w=\"") + kNsW +
               "\"><w:zoom w:percent=\"100\"/><w:defaultTabStop w:val=\"720\"/></w:settings>",
           "word/settings.xml", &doc);
  auto settings = RootElement(doc, "word/settings.xml");

  SetTrackRevisions(settings, "w", true);
  auto first = settings.first_child();
  assert(Is(first, "w", "zoom"));
  assert(Is(first.next_sibling(), "w", "trackRevisions"));
  assert(Is(first.next_sibling().next_sibling(), "w", "defaultTabStop"));

  SetAcceptedRevisionView(settings, "w", true);
  auto view = settings.child("w:revisionView");
  assert(view);
  assert(std::string(view.attribute("w:markup").value()) == "0");
  assert(std::string(view.attribute("w:insDel").value()) == "0");
  assert(view.next_sibling() == settings.child("w:trackRevisions"));

  // Writing the same setting twice does not duplicate it.
  SetTrackRevisions(settings, "w", true);
  assert(RemoveSetting(settings, "w", "trackRevisions") == 1);
  SetAcceptedRevisionView(settings, "w", false);
  assert(!settings.child("w:revisionView"));
  assert(!settings.child("w:trackRevisions"));
}

void TestSettingsPrependWhenNothingPrecedes() {
  pugi::xml_document doc;
  LoadPart(std::string("<w:settings xmlns:w=\"") + kNsW + "\"><w:compat/></w:settings>", "word/settings.xml", &doc);
  auto settings = RootElement(doc, "word/settings.xml");

  EnsureSetting(settings, "w", "zoom");
  assert(Is(settings.first_child(), "w", "zoom"));
}

} // namespace

int main() {
  TestStripInvalidXmlChars();
  TestTruncateCountsCodePoints();
  TestPrefixLookup();
  TestSaveWritesStandaloneDeclaration();
  TestMalformedPartIsCorrupt();
  TestSettingsKeepSchemaOrder();
  TestSettingsPrependWhenNothingPrecedes();

  std::cout << "docrev_unit_xml_part: pass\n";
  return 0;
}
