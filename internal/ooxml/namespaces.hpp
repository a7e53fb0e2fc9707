#pragma once

namespace docrev::ooxml {

// ------------------------------------------------------------------
// XML namespaces
// ------------------------------------------------------------------
inline constexpr const char* kNsW = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
inline constexpr const char* kNsR = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
inline constexpr const char* kNsCp = "http://schemas.openxmlformats.org/package/2006/metadata/core-properties";
inline constexpr const char* kNsDc = "http://purl.org/dc/elements/1.1/";
inline constexpr const char* kNsDcTerms = "http://purl.org/dc/terms/";
inline constexpr const char* kNsDcmiType = "http://purl.org/dc/dcmitype/";
inline constexpr const char* kNsXsi = "http://www.w3.org/2001/XMLSchema-instance";
inline constexpr const char* kNsExtendedProps = "http://schemas.openxmlformats.org/officeDocument/2006/extended-properties";
inline constexpr const char* kNsDocPropsVTypes = "http://schemas.openxmlformats.org/officeDocument/2006/docPropsVTypes";
inline constexpr const char* kNsPackageRels = "http://schemas.openxmlformats.org/package/2006/relationships";
inline constexpr const char* kNsContentTypes = "http://schemas.openxmlformats.org/package/2006/content-types";

// ------------------------------------------------------------------
// Relationship types
// ------------------------------------------------------------------
inline constexpr const char* kRelOfficeDocument = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
inline constexpr const char* kRelCoreProperties = "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties";
inline constexpr const char* kRelExtendedProperties =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties";
inline constexpr const char* kRelStyles = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
inline constexpr const char* kRelSettings = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/settings";
inline constexpr const char* kRelHeader = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/header";
inline constexpr const char* kRelFooter = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer";
inline constexpr const char* kRelFootnotes = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/footnotes";
inline constexpr const char* kRelEndnotes = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/endnotes";

// ------------------------------------------------------------------
// Content types
// ------------------------------------------------------------------
inline constexpr const char* kCtRelationships = "application/vnd.openxmlformats-package.relationships+xml";
inline constexpr const char* kCtXml = "application/xml";
inline constexpr const char* kCtMainDocument = "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml";
inline constexpr const char* kCtStyles = "application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml";
inline constexpr const char* kCtSettings = "application/vnd.openxmlformats-officedocument.wordprocessingml.settings+xml";
inline constexpr const char* kCtCoreProperties = "application/vnd.openxmlformats-package.core-properties+xml";
inline constexpr const char* kCtExtendedProperties = "application/vnd.openxmlformats-officedocument.extended-properties+xml";

// ------------------------------------------------------------------
// Well-known part names (fallbacks when relationships are absent)
// ------------------------------------------------------------------
inline constexpr const char* kPartContentTypes = "[Content_Types].xml";
inline constexpr const char* kPartRootRels = "_rels/.rels";
inline constexpr const char* kPartDocument = "word/document.xml";
inline constexpr const char* kPartDocumentRels = "word/_rels/document.xml.rels";
inline constexpr const char* kPartStyles = "word/styles.xml";
inline constexpr const char* kPartSettings = "word/settings.xml";
inline constexpr const char* kPartCore = "docProps/core.xml";
inline constexpr const char* kPartApp = "docProps/app.xml";

} // namespace docrev::ooxml
