#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace taskengine::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string&) override;
  Result CompareAndSwapTask(Transaction&, const model::TaskRecord&, uint64_t expected_version) override;
  Result DeleteTask(Transaction&, const std::string&) override;

  std::vector<model::TaskRecord> FindByStatusOlderThan(Transaction&, taskengine::model::TaskStatus status, AgeField field,
                                                       uint64_t cutoff_ms) override;
  std::vector<model::TaskRecord> ListTasksByStatus(Transaction&, taskengine::model::TaskStatus status) override;
  uint64_t CountTasks(Transaction&, taskengine::model::TaskStatus status) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::TaskRecord> Query(Transaction& t, const char* sql, int status, std::optional<uint64_t> cutoff_ms);

  std::shared_ptr<SqliteDB> db_;
};

}
