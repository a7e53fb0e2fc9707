#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/model/render_mode.hpp"
#include "internal/util/errors.hpp"

namespace docrev::db::sqlite {

using docrev::db::ErrorCode;
using docrev::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL)
        return std::nullopt;
    return ColText(st, col);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Reads raise instead of returning a Result: a table that cannot be read
// must not look like a missing document or an empty sentence list.
static sqlite3_stmt* PrepareRead(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        throw util::IOError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
    return st;
}

[[noreturn]] static void ThrowStepError(sqlite3* db, sqlite3_stmt* st) {
    std::string msg = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw util::IOError("sqlite read failed: " + msg);
}

static constexpr const char* kDocumentColumns =
    "id,filename,created_at_s,last_modified_s,author,last_modified_by,mode,title,subject,keywords,comments,total_edit_time_min";

// mode is returned raw; callers convert after sqlite3_finalize because
// RenderModeFromInt throws on an unknown value.
static model::DocumentRecord ReadDocumentRow(sqlite3_stmt* st, int* mode) {
    model::DocumentRecord r;
    r.id = ColI64(st, 0);
    r.filename = ColText(st, 1);
    r.created_at = util::FromUnixSeconds(ColI64(st, 2));
    r.last_modified = util::FromUnixSeconds(ColI64(st, 3));
    r.author = ColText(st, 4);
    r.last_modified_by = ColText(st, 5);
    *mode = sqlite3_column_int(st, 6);
    r.properties.title = ColOptText(st, 7);
    r.properties.subject = ColOptText(st, 8);
    r.properties.keywords = ColOptText(st, 9);
    r.properties.comments = ColOptText(st, 10);
    if (sqlite3_column_type(st, 11) != SQLITE_NULL)
        r.properties.total_edit_time_minutes = static_cast<uint32_t>(ColI64(st, 11));
    return r;
}

static std::vector<model::SentenceRecord> LoadSentences(sqlite3* db, int64_t document_id) {
    std::vector<model::SentenceRecord> out;

    const char* sql =
        "SELECT id,position,text,created_at_s,modified_at_s,author,revision_id "
        "FROM sentences WHERE document_id=? ORDER BY position;";

    sqlite3_stmt* st = PrepareRead(db, sql);
    BindI64(st, 1, document_id);

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::SentenceRecord s;
        s.id = ColI64(st, 0);
        s.position = static_cast<uint32_t>(ColI64(st, 1));
        s.text = ColText(st, 2);
        s.created_at = util::FromUnixSeconds(ColI64(st, 3));
        s.modified_at = util::FromUnixSeconds(ColI64(st, 4));
        s.author = ColText(st, 5);
        s.revision_id = static_cast<uint32_t>(ColI64(st, 6));
        out.push_back(std::move(s));
    }
    if (rc != SQLITE_DONE)
        ThrowStepError(db, st);

    sqlite3_finalize(st);
    return out;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result SqliteRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO documents(filename,created_at_s,last_modified_s,author,last_modified_by,mode,"
        "title,subject,keywords,comments,total_edit_time_min) VALUES(?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.filename);
    BindI64(st, 2, util::ToUnixSeconds(r.created_at));
    BindI64(st, 3, util::ToUnixSeconds(r.last_modified));
    BindText(st, 4, r.author);
    BindText(st, 5, r.last_modified_by);
    BindI64(st, 6, static_cast<int64_t>(r.properties.mode));
    BindOptText(st, 7, r.properties.title);
    BindOptText(st, 8, r.properties.subject);
    BindOptText(st, 9, r.properties.keywords);
    BindOptText(st, 10, r.properties.comments);
    if (r.properties.total_edit_time_minutes)
        BindI64(st, 11, *r.properties.total_edit_time_minutes);
    else
        sqlite3_bind_null(st, 11);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (!result) {
        if (result.code == ErrorCode::ConstraintViolation)
            return Result::Err(ErrorCode::AlreadyExists, "document already exists: " + r.filename);
        return result;
    }

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));

    const char* sentence_sql =
        "INSERT INTO sentences(document_id,position,text,created_at_s,modified_at_s,author,revision_id) "
        "VALUES(?,?,?,?,?,?,?);";

    if (sqlite3_prepare_v2(db, sentence_sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (auto& s : r.sentences) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);

        BindI64(st, 1, r.id);
        BindI64(st, 2, s.position);
        BindText(st, 3, s.text);
        BindI64(st, 4, util::ToUnixSeconds(s.created_at));
        BindI64(st, 5, util::ToUnixSeconds(s.modified_at));
        BindText(st, 6, s.author);
        BindI64(st, 7, s.revision_id);

        rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto err = Translate(db, rc);
            sqlite3_finalize(st);
            return err;
        }
        s.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

std::optional<model::DocumentRecord>
SqliteRepository::GetDocument(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id=?;";

    sqlite3_stmt* st = PrepareRead(db, sql.c_str());
    BindI64(st, 1, id);

    const int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW)
        ThrowStepError(db, st);

    int mode = 0;
    auto r = ReadDocumentRow(st, &mode);
    sqlite3_finalize(st);

    r.properties.mode = docrev::model::RenderModeFromInt(mode);
    r.sentences = LoadSentences(db, r.id);
    return r;
}

std::optional<model::DocumentRecord>
SqliteRepository::GetDocumentByFilename(Transaction& t, const std::string& filename) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE filename=?;";

    sqlite3_stmt* st = PrepareRead(db, sql.c_str());
    BindText(st, 1, filename);

    const int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW)
        ThrowStepError(db, st);

    int mode = 0;
    auto r = ReadDocumentRow(st, &mode);
    sqlite3_finalize(st);

    r.properties.mode = docrev::model::RenderModeFromInt(mode);
    r.sentences = LoadSentences(db, r.id);
    return r;
}

std::vector<model::DocumentRecord> SqliteRepository::ListDocuments(Transaction& t) {
    auto* db = TX(t).Handle();
    std::vector<model::DocumentRecord> out;

    const std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents ORDER BY id;";

    sqlite3_stmt* st = PrepareRead(db, sql.c_str());

    std::vector<int> modes;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        int mode = 0;
        out.push_back(ReadDocumentRow(st, &mode));
        modes.push_back(mode);
    }
    if (rc != SQLITE_DONE)
        ThrowStepError(db, st);

    sqlite3_finalize(st);

    for (size_t i = 0; i < out.size(); ++i) {
        out[i].properties.mode = docrev::model::RenderModeFromInt(modes[i]);
        out[i].sentences = LoadSentences(db, out[i].id);
    }

    return out;
}

Result SqliteRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE documents SET filename=?,created_at_s=?,last_modified_s=?,author=?,last_modified_by=?,mode=?,"
        "title=?,subject=?,keywords=?,comments=?,total_edit_time_min=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.filename);
    BindI64(st, 2, util::ToUnixSeconds(r.created_at));
    BindI64(st, 3, util::ToUnixSeconds(r.last_modified));
    BindText(st, 4, r.author);
    BindText(st, 5, r.last_modified_by);
    BindI64(st, 6, static_cast<int64_t>(r.properties.mode));
    BindOptText(st, 7, r.properties.title);
    BindOptText(st, 8, r.properties.subject);
    BindOptText(st, 9, r.properties.keywords);
    BindOptText(st, 10, r.properties.comments);
    if (r.properties.total_edit_time_minutes)
        BindI64(st, 11, *r.properties.total_edit_time_minutes);
    else
        sqlite3_bind_null(st, 11);
    BindI64(st, 12, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "document not found");
    return result;
}

Result SqliteRepository::DeleteDocument(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM documents WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "document not found");
    return result;
}

// ------------------------------------------------------------------
// Sentences
// ------------------------------------------------------------------

Result SqliteRepository::UpdateSentence(Transaction& t, int64_t document_id, const model::SentenceRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE sentences SET text=?,created_at_s=?,modified_at_s=?,author=?,revision_id=? "
        "WHERE document_id=? AND position=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.text);
    BindI64(st, 2, util::ToUnixSeconds(r.created_at));
    BindI64(st, 3, util::ToUnixSeconds(r.modified_at));
    BindText(st, 4, r.author);
    BindI64(st, 5, r.revision_id);
    BindI64(st, 6, document_id);
    BindI64(st, 7, r.position);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "sentence not found");
    return result;
}

} // namespace docrev::db::sqlite
