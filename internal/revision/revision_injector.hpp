#pragma once

#include <vector>

#include "internal/db/model/sentence_record.hpp"
#include "internal/model/render_mode.hpp"
#include "internal/package/package.hpp"

namespace docrev::revision {

/*
  RevisionInjector

  Rewrites a baseline package so each body paragraph carries the timeline
  of its SentenceRecord. Paragraph i of the body belongs to records[i].

    kSuggestions  paragraph content wrapped in
                    <w:ins w:id=revision_id w:author=author w:date=modified_at>
                  settings: <w:trackRevisions/>, no <w:revisionView>

    kFinal        same wrapping
                  settings: <w:revisionView w:markup="0" w:insDel="0"/>,
                  no <w:trackRevisions>

    kClean        no wrapping, neither settings element

  Existing insertion wrappers on the owned paragraphs are replaced, so
  injecting an already injected package is stable. The input package is
  never modified.

  Throws:
    util::UnsupportedMode     - mode outside the enum
    util::DuplicateRevisionId - two records share a revision id
    util::RecordCountMismatch - records != paragraphs directly under w:body
    util::CorruptPackage      - body or settings part unparseable, no w:body
    util::MissingRequiredPart - no main document part
*/
class RevisionInjector {
 public:
  package::Package Inject(const package::Package& baseline, const std::vector<db::model::SentenceRecord>& records,
                          model::RenderMode mode) const;
};

} // namespace docrev::revision
