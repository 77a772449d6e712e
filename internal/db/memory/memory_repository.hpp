#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace taskengine::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TaskRecord> tasks;
  };

  // Held by a MemoryTransaction for its whole lifetime.
  std::mutex mutex_;
  State committed_;
};

}
