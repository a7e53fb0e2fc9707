#include "xml_part.hpp"

#include <cstdint>
#include <cstring>
#include <utility>

#include "internal/util/errors.hpp"

namespace docrev::ooxml {

namespace {

constexpr unsigned int kParseFlags = pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata_single;
constexpr unsigned int kSaveFlags  = pugi::format_raw | pugi::format_no_declaration;

struct StringWriter : pugi::xml_writer {
  std::string s;

  void write(const void* data, size_t size) override {
    if (data && size > 0) {
      s.append(static_cast<const char*>(data), size);
    }
  }
};

void SetAttribute(pugi::xml_node node, const char* name, const char* value) {
  auto attr = node.attribute(name);
  if (!attr) {
    attr = node.append_attribute(name);
  }
  attr.set_value(value);
}

bool IsAllowedCodePoint(uint32_t cp) {
  return cp == 0x9 || cp == 0xA || cp == 0xD || (cp >= 0x20 && cp <= 0xD7FF) || (cp >= 0xE000 && cp <= 0xFFFD) ||
         (cp >= 0x10000 && cp <= 0x10FFFF);
}

/*
  Decodes one UTF-8 sequence starting at text[i].
  Returns the sequence length, or 0 when malformed (overlong, truncated,
  surrogate, out of range). On success *cp holds the code point.
*/
size_t DecodeUtf8(std::string_view text, size_t i, uint32_t* cp) {
  const auto lead = static_cast<unsigned char>(text[i]);

  size_t   length = 0;
  uint32_t value  = 0;
  if (lead < 0x80) {
    *cp = lead;
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    length = 2;
    value  = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    value  = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    value  = lead & 0x07;
  } else {
    return 0;
  }

  if (i + length > text.size()) {
    return 0;
  }
  for (size_t k = 1; k < length; ++k) {
    const auto cont = static_cast<unsigned char>(text[i + k]);
    if ((cont & 0xC0) != 0x80) {
      return 0;
    }
    value = (value << 6) | (cont & 0x3F);
  }

  static constexpr uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
  if (value < kMinForLength[length] || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
    return 0;
  }

  *cp = value;
  return length;
}

} // namespace

void LoadPart(const std::string& bytes, const std::string& part_name, pugi::xml_document* doc) {
  const auto result = doc->load_buffer(bytes.data(), bytes.size(), kParseFlags, pugi::encoding_auto);
  if (!result) {
    throw util::CorruptPackage(part_name + " is not well-formed XML: " + result.description() + " at offset " +
                               std::to_string(result.offset));
  }
}

std::string SavePart(pugi::xml_document& doc) {
  auto decl = doc.first_child();
  if (decl.type() != pugi::node_declaration) {
    decl = doc.prepend_child(pugi::node_declaration);
  }
  SetAttribute(decl, "version", "1.0");
  SetAttribute(decl, "encoding", "UTF-8");
  SetAttribute(decl, "standalone", "yes");

  StringWriter writer;
  doc.save(writer, "", kSaveFlags, pugi::encoding_utf8);
  return std::move(writer.s);
}

pugi::xml_node RootElement(const pugi::xml_document& doc, const std::string& part_name) {
  auto root = doc.document_element();
  if (!root) {
    throw util::CorruptPackage(part_name + " has no root element");
  }
  return root;
}

std::optional<std::string> FindPrefix(const pugi::xml_node& root, const char* ns_uri) {
  for (auto attr : root.attributes()) {
    if (std::strcmp(attr.value(), ns_uri) != 0) {
      continue;
    }
    std::string_view name = attr.name();
    if (name == "xmlns") {
      return std::string{};
    }
    if (name.rfind("xmlns:", 0) == 0) {
      return std::string(name.substr(6));
    }
  }
  return std::nullopt;
}

std::string PrefixFor(const pugi::xml_node& root, const char* ns_uri, const std::string& fallback) {
  return FindPrefix(root, ns_uri).value_or(fallback);
}

std::string EnsureNamespace(pugi::xml_node root, const char* ns_uri, const std::string& preferred) {
  if (auto prefix = FindPrefix(root, ns_uri)) {
    return *prefix;
  }
  root.append_attribute(("xmlns:" + preferred).c_str()).set_value(ns_uri);
  return preferred;
}

std::string QName(const std::string& prefix, std::string_view local) {
  if (prefix.empty()) {
    return std::string(local);
  }
  std::string out;
  out.reserve(prefix.size() + 1 + local.size());
  out.append(prefix).append(":").append(local);
  return out;
}

std::string_view LocalName(const pugi::xml_node& node) {
  std::string_view name = node.name();
  const auto       colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::string_view Prefix(const pugi::xml_node& node) {
  std::string_view name = node.name();
  const auto       colon = name.find(':');
  return colon == std::string_view::npos ? std::string_view{} : name.substr(0, colon);
}

bool Is(const pugi::xml_node& node, const std::string& prefix, std::string_view local) {
  return node.type() == pugi::node_element && Prefix(node) == prefix && LocalName(node) == local;
}

void SetText(pugi::xml_node node, const std::string& value) {
  while (auto child = node.first_child()) {
    node.remove_child(child);
  }
  if (!value.empty()) {
    node.text().set(value.c_str());
  }
}

std::string StripInvalidXmlChars(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    uint32_t     cp     = 0;
    const size_t length = DecodeUtf8(text, i, &cp);
    if (length == 0) {
      ++i;
      continue;
    }
    if (IsAllowedCodePoint(cp)) {
      out.append(text.substr(i, length));
    }
    i += length;
  }
  return out;
}

std::string TruncateCodePoints(std::string_view text, size_t max_code_points) {
  size_t count = 0;
  size_t i     = 0;
  while (i < text.size() && count < max_code_points) {
    uint32_t cp     = 0;
    size_t   length = DecodeUtf8(text, i, &cp);
    i += length == 0 ? 1 : length;
    ++count;
  }
  return std::string(text.substr(0, i));
}

std::string CleanAuthor(std::string_view author) {
  return TruncateCodePoints(StripInvalidXmlChars(author), kMaxAuthorLength);
}

} // namespace docrev::ooxml
