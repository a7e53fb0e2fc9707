#pragma once

#include <string>
#include <vector>

#include "internal/db/model/sentence_record.hpp"
#include "internal/model/document_properties.hpp"
#include "internal/package/package.hpp"

namespace docrev::builder {

struct BuilderOptions {
  std::string application_name = "Microsoft Office Word";
  std::string app_version      = "16.0000";

  // cp:lastModifiedBy; the author when empty.
  std::string last_modified_by;
};

/*
  DocumentBuilder

  Produces a baseline package with no revision markup:

    [Content_Types].xml, _rels/.rels
    word/document.xml, word/_rels/document.xml.rels
    word/styles.xml, word/settings.xml
    docProps/core.xml, docProps/app.xml

  One paragraph per record, in the order given. Every paragraph but the
  last ends with a separate single-space run so the sentences read as
  continuous prose when the paragraphs are joined.

  Throws util::EmptyDocument when `records` is empty.
*/
class DocumentBuilder {
 public:
  explicit DocumentBuilder(BuilderOptions options = {});

  package::Package Build(const std::vector<db::model::SentenceRecord>& records, const model::DocumentProperties& properties,
                         const std::string& author) const;

 private:
  std::string DocumentXml(const std::vector<db::model::SentenceRecord>& records) const;
  std::string CoreXml(const std::vector<db::model::SentenceRecord>& records, const model::DocumentProperties& properties,
                      const std::string& author) const;
  std::string AppXml(const std::vector<db::model::SentenceRecord>& records, const model::DocumentProperties& properties) const;

  BuilderOptions options_;
};

} // namespace docrev::builder
