#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace taskengine::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;
constexpr int kSchemaVersion = 1;

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite ") + what + ": " + sqlite3_errmsg(db));
  }
}

void CreateParentDirectory(const std::string& path) {
  if (path.empty() || path == ":memory:" || path.rfind("file:", 0) == 0) return;

  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("sqlite: cannot create directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

SqliteDB::SqliteDB(const std::string& path) {
  CreateParentDirectory(path);

  const int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "open failed";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "exec failed";
    sqlite3_free(err);
    throw std::runtime_error("sqlite: " + msg);
  }
}

void SqliteDB::Configure() {
  // progress reads keep going while a worker flush holds the write lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // AlreadyExists needs SQLITE_CONSTRAINT_PRIMARYKEY, not plain SQLITE_CONSTRAINT
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");
  ThrowIf(sqlite3_busy_timeout(db_, kBusyTimeoutMs), db_, "busy_timeout");
}

void SqliteDB::EnsureTaskSchema() {
  std::lock_guard lock(tx_mutex_);

  Exec("BEGIN IMMEDIATE;");
  try {
    Exec("CREATE TABLE IF NOT EXISTS task ("
         "id TEXT PRIMARY KEY, kind TEXT NOT NULL, x INTEGER NOT NULL, y INTEGER NOT NULL, current INTEGER NOT NULL, "
         "status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL, "
         "error_message TEXT NOT NULL DEFAULT '');");
    Exec("CREATE INDEX IF NOT EXISTS task_status_created_idx ON task(status, created_at_ms);");
    Exec("CREATE INDEX IF NOT EXISTS task_status_updated_idx ON task(status, updated_at_ms);");
    Exec("CREATE TABLE IF NOT EXISTS task_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");
    Exec("INSERT OR IGNORE INTO task_schema_migrations (version, applied_at_ms) VALUES (" + std::to_string(kSchemaVersion) +
         ", CAST(strftime('%s','now') AS INTEGER) * 1000);");
    Exec("COMMIT;");
  } catch (...) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }

  // fails loudly if an older file lacks a column the repository reads
  Exec("SELECT id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message FROM task LIMIT 1;");
}

} // namespace taskengine::db::sqlite
