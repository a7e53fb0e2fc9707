#include "revision_injector.hpp"

#include <set>
#include <string>

#include <pugixml.hpp>

#include "internal/model/render_mode.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ooxml/namespaces.hpp"
#include "internal/ooxml/part_locator.hpp"
#include "internal/ooxml/settings.hpp"
#include "internal/ooxml/xml_part.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docrev::revision {

namespace {

struct ModeFlags {
  bool wrap;
  bool track_revisions;
  bool accepted_view;
};

ModeFlags FlagsFor(model::RenderMode mode) {
  switch (mode) {
    case model::RenderMode::kSuggestions:
    case model::RenderMode::kFinal:
    case model::RenderMode::kClean:
      return {model::EmitsInsertions(mode), mode == model::RenderMode::kSuggestions, mode == model::RenderMode::kFinal};
  }
  throw util::UnsupportedMode("unsupported render mode " + std::to_string(static_cast<int>(mode)));
}

void CheckRevisionIds(const std::vector<db::model::SentenceRecord>& records) {
  std::set<uint32_t> seen;
  for (const auto& record : records) {
    if (!seen.insert(record.revision_id).second) {
      throw util::DuplicateRevisionId("revision id " + std::to_string(record.revision_id) + " is used by more than one sentence");
    }
  }
}

// Moves the children of every w:ins directly under `paragraph` up one level.
void UnwrapInsertions(pugi::xml_node paragraph, const std::string& w) {
  const auto ins_name = ooxml::QName(w, "ins");
  for (auto ins = paragraph.child(ins_name.c_str()); ins; ins = paragraph.child(ins_name.c_str())) {
    while (auto child = ins.first_child()) {
      paragraph.insert_move_before(child, ins);
    }
    paragraph.remove_child(ins);
  }
}

void WrapParagraph(pugi::xml_node paragraph, const std::string& w, const db::model::SentenceRecord& record) {
  const auto ppr_name = ooxml::QName(w, "pPr");

  auto ppr = paragraph.child(ppr_name.c_str());
  auto ins = ppr ? paragraph.insert_child_after(ooxml::QName(w, "ins").c_str(), ppr)
                 : paragraph.prepend_child(ooxml::QName(w, "ins").c_str());

  ins.append_attribute(ooxml::QName(w, "id").c_str()).set_value(record.revision_id);
  ins.append_attribute(ooxml::QName(w, "author").c_str()).set_value(ooxml::CleanAuthor(record.author).c_str());
  ins.append_attribute(ooxml::QName(w, "date").c_str()).set_value(util::FormatW3CDTF(record.modified_at).c_str());

  while (auto next = ins.next_sibling()) {
    ins.append_move(next);
  }
}

std::string RewriteBody(const std::string& bytes, const std::string& part_name, const std::vector<db::model::SentenceRecord>& records,
                        const ModeFlags& flags) {
  pugi::xml_document doc;
  ooxml::LoadPart(bytes, part_name, &doc);
  auto root = ooxml::RootElement(doc, part_name);

  const auto w    = ooxml::PrefixFor(root, ooxml::kNsW, "w");
  auto       body = root.child(ooxml::QName(w, "body").c_str());
  if (!body) {
    throw util::CorruptPackage(part_name + " has no w:body");
  }

  std::vector<pugi::xml_node> paragraphs;
  for (auto child : body.children(ooxml::QName(w, "p").c_str())) {
    paragraphs.push_back(child);
  }
  if (paragraphs.size() != records.size()) {
    throw util::RecordCountMismatch(std::to_string(records.size()) + " sentence records for " + std::to_string(paragraphs.size()) +
                                    " body paragraphs");
  }

  for (size_t i = 0; i < paragraphs.size(); ++i) {
    UnwrapInsertions(paragraphs[i], w);
    if (flags.wrap) {
      WrapParagraph(paragraphs[i], w, records[i]);
    }
  }

  return ooxml::SavePart(doc);
}

void ApplySettings(package::Package* pkg, const std::string& main_part, const ModeFlags& flags) {
  const auto part = ooxml::EnsureSettingsPart(pkg, main_part);

  pugi::xml_document doc;
  ooxml::LoadPart(pkg->at(part), part, &doc);
  auto settings = ooxml::RootElement(doc, part);

  const auto w = ooxml::PrefixFor(settings, ooxml::kNsW, "w");
  ooxml::SetTrackRevisions(settings, w, flags.track_revisions);
  ooxml::SetAcceptedRevisionView(settings, w, flags.accepted_view);

  (*pkg)[part] = ooxml::SavePart(doc);
}

} // namespace

package::Package RevisionInjector::Inject(const package::Package& baseline, const std::vector<db::model::SentenceRecord>& records,
                                          model::RenderMode mode) const {
  const auto flags = FlagsFor(mode);
  CheckRevisionIds(records);

  const auto main_part = ooxml::MainDocumentPart(baseline);
  if (!main_part) {
    throw util::MissingRequiredPart("package has no main document part");
  }

  package::Package out = baseline;
  out[*main_part]      = RewriteBody(baseline.at(*main_part), *main_part, records, flags);
  ApplySettings(&out, *main_part, flags);

  DOCREV_LOG_DEBUG("revisions injected", {observability::StringField("mode", model::ToString(mode)),
                                          observability::IntField("sentences", static_cast<int64_t>(records.size()))});
  return out;
}

} // namespace docrev::revision
