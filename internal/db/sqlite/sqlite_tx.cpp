#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace taskengine::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->Lock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      TASKENGINE_LOG_WARN("sqlite rollback failed", {taskengine::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  db_->Exec("ROLLBACK;");
  finished_ = true;
  lock_.unlock();
}

} // namespace taskengine::db::sqlite
