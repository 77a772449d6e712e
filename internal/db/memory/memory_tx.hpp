#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace taskengine::db::memory {

/*
  Transaction = exclusive store lock + undo log

  Writes go straight to the committed state while the lock is held;
  Rollback() replays the undo log in reverse. Transactions are short
  (one compare-and-swap), so serializing them is cheap.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return repo_.committed_;
  }
  const MemoryRepository::State& View() const {
    return repo_.committed_;
  }

  // Remember the prior value of `id` before it is changed.
  void RecordUndo(const std::string& id);

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;

  std::vector<std::pair<std::string, std::optional<model::TaskRecord>>> undo_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace taskengine::db::memory
