#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace taskengine::db::sqlite {

/*
  Owns the single connection to a task database file.

  Every transaction shares it; Lock() serializes them so BEGIN/COMMIT
  pairs from different threads never interleave on the handle. Opening
  creates the file (and its parent directories) and applies the pragmas
  the task store relies on: WAL, extended result codes and a busy
  timeout.
*/
class SqliteDB {
 public:
  explicit SqliteDB(const std::string& path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  void Exec(const std::string& sql);

  // Creates the task table, its age indexes and the migration marker if
  // missing. Safe to run on every start.
  void EnsureTaskSchema();

  std::unique_lock<std::mutex> Lock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void Configure();

  sqlite3*   db_ = nullptr;
  std::mutex tx_mutex_;
};

} // namespace taskengine::db::sqlite
