#include "sqlite_artifact_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace colguard::db::sqlite {

using colguard::db::ErrorCode;
using colguard::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    const int   n = sqlite3_column_bytes(st, col);
    return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(n)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static model::ArtifactRecord ReadRow(sqlite3_stmt* st) {
    model::ArtifactRecord r;
    r.key = ColText(st, 0);
    r.kind = ColText(st, 1);
    r.payload = ColBlob(st, 2);
    r.updated_at_ms = ColU64(st, 3);
    return r;
}

SqliteArtifactRepository::SqliteArtifactRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    sql::RunMigrations(*db_, sql::ArtifactMigrations());
}

std::unique_ptr<db::Transaction> SqliteArtifactRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteArtifactRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteArtifactRepository::Translate(sqlite3* db, int rc) {
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
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result SqliteArtifactRepository::UpsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::UPSERT_ARTIFACT, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindText(st, 1, r.key);
    BindText(st, 2, r.kind);
    BindBlob(st, 3, r.payload);
    BindU64(st, 4, r.updated_at_ms);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::ArtifactRecord>
SqliteArtifactRepository::GetArtifact(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_ARTIFACT, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, key);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadRow(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::ArtifactRecord> SqliteArtifactRepository::ListArtifacts(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::ArtifactRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::LIST_ARTIFACTS, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteArtifactRepository::DeleteArtifact(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql::DELETE_ARTIFACT, -1, &st, nullptr);
    if (rc != SQLITE_OK)
        return Translate(db, rc);

    BindText(st, 1, key);
    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

} // namespace colguard::db::sqlite
