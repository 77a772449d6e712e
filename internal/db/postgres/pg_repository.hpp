#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace taskengine::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
