#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <pugixml.hpp>

namespace docrev::ooxml {

/*
  XML part helpers (pugixml).

  Parts are parsed with whitespace-only text preserved when it is the only
  child of an element, so <w:t xml:space="preserve"> </w:t> survives a
  load/save cycle. Serialization is raw (no indentation) and always starts
  with the standalone UTF-8 declaration Word writes.
*/

// Throws util::CorruptPackage naming `part_name` when `bytes` is not well-formed.
void LoadPart(const std::string& bytes, const std::string& part_name, pugi::xml_document* doc);

std::string SavePart(pugi::xml_document& doc);

// Root element of a loaded part, or util::CorruptPackage when there is none.
pugi::xml_node RootElement(const pugi::xml_document& doc, const std::string& part_name);

// ------------------------------------------------------------------
// Namespace prefixes
// ------------------------------------------------------------------

// Prefix bound to `ns_uri` on the root element; "" for the default
// namespace, nullopt when undeclared.
std::optional<std::string> FindPrefix(const pugi::xml_node& root, const char* ns_uri);

// FindPrefix, or `fallback` when the namespace is not declared.
std::string PrefixFor(const pugi::xml_node& root, const char* ns_uri, const std::string& fallback);

// PrefixFor, declaring xmlns:`preferred` on `root` when the namespace is absent.
std::string EnsureNamespace(pugi::xml_node root, const char* ns_uri, const std::string& preferred);

// "w" + "p" -> "w:p"; "" + "p" -> "p".
std::string QName(const std::string& prefix, std::string_view local);

std::string_view LocalName(const pugi::xml_node& node);
std::string_view Prefix(const pugi::xml_node& node);

bool Is(const pugi::xml_node& node, const std::string& prefix, std::string_view local);

// Replaces all children of `node` with `value`; an empty value leaves it empty.
void SetText(pugi::xml_node node, const std::string& value);

// ------------------------------------------------------------------
// Text hygiene
// ------------------------------------------------------------------

// Drops code points XML 1.0 cannot carry and malformed UTF-8 sequences.
std::string StripInvalidXmlChars(std::string_view text);

// Keeps at most `max_code_points` UTF-8 code points.
std::string TruncateCodePoints(std::string_view text, size_t max_code_points);

inline constexpr size_t kMaxAuthorLength = 255;

// StripInvalidXmlChars + TruncateCodePoints(kMaxAuthorLength).
std::string CleanAuthor(std::string_view author);

} // namespace docrev::ooxml
