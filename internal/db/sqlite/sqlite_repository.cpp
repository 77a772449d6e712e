#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace taskengine::db::sqlite {

using taskengine::db::ErrorCode;
using taskengine::db::Result;
using taskengine::model::TaskStatus;

namespace {

constexpr const char* kTaskColumns = "id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

TaskStatus ColStatus(sqlite3_stmt* st, int col) {
    const int  raw    = sqlite3_column_int(st, col);
    const auto status = taskengine::model::StatusFromInt(raw);
    if (!status)
        throw std::runtime_error("sqlite: unknown task status " + std::to_string(raw));
    return *status;
}

model::TaskRecord ReadRow(sqlite3_stmt* st) {
    model::TaskRecord r;
    r.id            = ColText(st, 0);
    r.kind          = ColText(st, 1);
    r.x             = ColI64(st, 2);
    r.y             = ColI64(st, 3);
    r.current       = ColI64(st, 4);
    r.status        = ColStatus(st, 5);
    r.created_at_ms = ColU64(st, 6);
    r.updated_at_ms = ColU64(st, 7);
    r.version       = ColU64(st, 8);
    r.error_message = ColText(st, 9);
    return r;
}

// Binds kind..error_message of `r` starting at `first`.
int BindMutableColumns(sqlite3_stmt* st, int first, const model::TaskRecord& r) {
    BindText(st, first, r.kind);
    BindI64(st, first + 1, r.x);
    BindI64(st, first + 2, r.y);
    BindI64(st, first + 3, r.current);
    BindI32(st, first + 4, static_cast<int>(r.status));
    BindU64(st, first + 5, r.created_at_ms);
    BindU64(st, first + 6, r.updated_at_ms);
    BindU64(st, first + 7, r.version);
    BindText(st, first + 8, r.error_message);
    return first + 9;
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

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
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
// Task lifecycle
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO task(id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message) "
        "VALUES(?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindMutableColumns(st, 2, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::TaskRecord>
SqliteRepository::GetTask(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM task WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE)
            throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
        return std::nullopt;
    }

    model::TaskRecord r;
    try {
        r = ReadRow(st);
    } catch (...) {
        sqlite3_finalize(st);
        throw;
    }
    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::CompareAndSwapTask(Transaction& t, const model::TaskRecord& r, uint64_t expected_version) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE task SET kind=?,x=?,y=?,current=?,status=?,created_at_ms=?,updated_at_ms=?,version=?,error_message=? "
        "WHERE id=? AND version=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int next = BindMutableColumns(st, 1, r);
    BindText(st, next, r.id);
    BindU64(st, next + 1, expected_version);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (!result) return result;

    if (sqlite3_changes(db) == 1) return Result::Ok();

    // Nothing matched: distinguish a missing row from a stale version.
    if (!GetTask(t, r.id)) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Err(ErrorCode::Conflict, "version mismatch for " + r.id);
}

Result SqliteRepository::DeleteTask(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM task WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<model::TaskRecord> SqliteRepository::Query(Transaction& t, const char* sql, int status, std::optional<uint64_t> cutoff_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindI32(st, 1, status);
    if (cutoff_ms) BindU64(st, 2, *cutoff_ms);

    std::vector<model::TaskRecord> out;
    int rc = SQLITE_OK;
    try {
        while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
            out.push_back(ReadRow(st));
        }
    } catch (...) {
        sqlite3_finalize(st);
        throw;
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    return out;
}

std::vector<model::TaskRecord>
SqliteRepository::FindByStatusOlderThan(Transaction& t, TaskStatus status, AgeField field, uint64_t cutoff_ms) {
    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM task WHERE status=? AND " +
                            (field == AgeField::kCreatedAt ? "created_at_ms" : "updated_at_ms") + " < ? ORDER BY created_at_ms;";
    return Query(t, sql.c_str(), static_cast<int>(status), cutoff_ms);
}

std::vector<model::TaskRecord> SqliteRepository::ListTasksByStatus(Transaction& t, TaskStatus status) {
    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM task WHERE status=? ORDER BY created_at_ms;";
    return Query(t, sql.c_str(), static_cast<int>(status), std::nullopt);
}

uint64_t SqliteRepository::CountTasks(Transaction& t, TaskStatus status) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT COUNT(*) FROM task WHERE status=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(status));

    uint64_t count = 0;
    if (sqlite3_step(st) == SQLITE_ROW) count = ColU64(st, 0);
    sqlite3_finalize(st);
    return count;
}

} // namespace taskengine::db::sqlite
