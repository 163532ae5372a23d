#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace archive::db::sqlite {

using archive::db::ErrorCode;
using archive::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        st = nullptr;
    }
    return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// true on SQLITE_ROW, false on SQLITE_DONE; any other step result throws so
// a failed read is never mistaken for an absent row.
bool StepRow(sqlite3* db, sqlite3_stmt* st, const char* what) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step (") + what + "): " + sqlite3_errmsg(db));
}

} // namespace

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

    switch (rc & 0xff) {
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
// Media records
// ------------------------------------------------------------------

Result SqliteRepository::WriteLabels(sqlite3* db, const model::MediaRecord& r) {
    auto del = Prepare(db, "DELETE FROM media_label WHERE record_id=?;");
    if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(del.get(), 1, r.record_id);
    auto res = Translate(db, sqlite3_step(del.get()));
    if (!res) return res;

    auto ins = Prepare(db, "INSERT INTO media_label(record_id,position,label) VALUES(?,?,?);");
    if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    // position keeps the caller's label order
    for (size_t i = 0; i < r.metadata.labels.size(); ++i) {
        sqlite3_reset(ins.get());
        BindU64(ins.get(), 1, r.record_id);
        BindU64(ins.get(), 2, i);
        BindText(ins.get(), 3, r.metadata.labels[i]);
        res = Translate(db, sqlite3_step(ins.get()));
        if (!res) return res;
    }
    return Result::Ok();
}

Result SqliteRepository::InsertRecord(Transaction& t, const model::MediaRecord& r) {
    auto* db = TX(t).Handle();

    {
        auto existing = Prepare(db, "SELECT 1 FROM media_record WHERE record_id=?;");
        if (!existing) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindU64(existing.get(), 1, r.record_id);
        const int rc = sqlite3_step(existing.get());
        if (rc == SQLITE_ROW) return Result::Err(ErrorCode::AlreadyExists);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    auto st = Prepare(db,
        "INSERT INTO media_record(record_id,owner,byte_count,created_at,name,summary) "
        "VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, r.record_id);
    BindText(st.get(), 2, r.owner);
    BindU64(st.get(), 3, r.metadata.byte_count);
    BindU64(st.get(), 4, r.created_at);
    BindText(st.get(), 5, r.metadata.name);
    BindText(st.get(), 6, r.metadata.summary);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;

    return WriteLabels(db, r);
}

std::optional<model::MediaRecord>
SqliteRepository::GetRecord(Transaction& t, uint64_t record_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT record_id,owner,byte_count,created_at,name,summary "
        "FROM media_record WHERE record_id=?;");
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindU64(st.get(), 1, record_id);

    if (!StepRow(db, st.get(), "media_record"))
        return std::nullopt;

    model::MediaRecord r;
    r.record_id = ColU64(st.get(), 0);
    r.owner = ColText(st.get(), 1);
    r.metadata.byte_count = ColU64(st.get(), 2);
    r.created_at = ColU64(st.get(), 3);
    r.metadata.name = ColText(st.get(), 4);
    r.metadata.summary = ColText(st.get(), 5);

    auto labels = Prepare(db, "SELECT label FROM media_label WHERE record_id=? ORDER BY position;");
    if (!labels) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindU64(labels.get(), 1, record_id);
    while (StepRow(db, labels.get(), "media_label")) {
        r.metadata.labels.push_back(ColText(labels.get(), 0));
    }

    return r;
}

Result SqliteRepository::UpdateRecord(Transaction& t, const model::MediaRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE media_record SET owner=?,byte_count=?,created_at=?,name=?,summary=? "
        "WHERE record_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.owner);
    BindU64(st.get(), 2, r.metadata.byte_count);
    BindU64(st.get(), 3, r.created_at);
    BindText(st.get(), 4, r.metadata.name);
    BindText(st.get(), 5, r.metadata.summary);
    BindU64(st.get(), 6, r.record_id);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);

    return WriteLabels(db, r);
}

Result SqliteRepository::DeleteRecord(Transaction& t, uint64_t record_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM media_record WHERE record_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, record_id);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);

    return Result::Ok();
}

// ------------------------------------------------------------------
// Access matrix
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAccess(Transaction& t, const model::AccessRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO media_access(record_id,principal,can_access) VALUES(?,?,?) "
        "ON CONFLICT(record_id,principal) DO UPDATE SET can_access=excluded.can_access;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, r.record_id);
    BindText(st.get(), 2, r.principal);
    sqlite3_bind_int(st.get(), 3, r.can_access ? 1 : 0);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AccessRecord>
SqliteRepository::GetAccess(Transaction& t, uint64_t record_id, const std::string& principal) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT can_access FROM media_access WHERE record_id=? AND principal=?;");
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindU64(st.get(), 1, record_id);
    BindText(st.get(), 2, principal);

    if (!StepRow(db, st.get(), "media_access"))
        return std::nullopt;

    return model::AccessRecord{record_id, principal, sqlite3_column_int(st.get(), 0) != 0};
}

Result SqliteRepository::DeleteAccess(Transaction& t, uint64_t record_id, const std::string& principal) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM media_access WHERE record_id=? AND principal=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, record_id);
    BindText(st.get(), 2, principal);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Sequence
// ------------------------------------------------------------------

uint64_t SqliteRepository::GetTotalItems(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT total_items FROM archive_sequence WHERE id=0;");
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    if (!StepRow(db, st.get(), "archive_sequence"))
        throw std::runtime_error("archive_sequence row missing; schema was not bootstrapped");

    return ColU64(st.get(), 0);
}

Result SqliteRepository::SetTotalItems(Transaction& t, uint64_t total_items) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE archive_sequence SET total_items=? WHERE id=0;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, total_items);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Corruption, "archive_sequence row missing");

    return Result::Ok();
}

} // namespace archive::db::sqlite
