#include "memory_tx.hpp"

#include <stdexcept>

namespace taskengine::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::RecordUndo(const std::string& id) {
  const auto& tasks = repo_.committed_.tasks;
  auto        it    = tasks.find(id);
  if (it == tasks.end()) {
    undo_.emplace_back(id, std::nullopt);
  } else {
    undo_.emplace_back(id, it->second);
  }
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }
  undo_.clear();
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }

  auto& tasks = repo_.committed_.tasks;
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    if (it->second) {
      tasks[it->first] = *it->second;
    } else {
      tasks.erase(it->first);
    }
  }
  undo_.clear();
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace taskengine::db::memory
