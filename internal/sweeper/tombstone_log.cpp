#include "internal/sweeper/tombstone_log.hpp"

namespace taskengine::sweeper {

TombstoneLog::TombstoneLog(std::size_t capacity) : capacity_(capacity) {
}

void TombstoneLog::Add(const std::string& task_id) {
  if (capacity_ == 0) return;

  std::lock_guard lock(mutex_);

  if (!ids_.insert(task_id).second) return;
  order_.push_back(task_id);

  while (order_.size() > capacity_) {
    ids_.erase(order_.front());
    order_.pop_front();
  }
}

bool TombstoneLog::Contains(const std::string& task_id) const {
  std::lock_guard lock(mutex_);
  return ids_.contains(task_id);
}

std::size_t TombstoneLog::Size() const {
  std::lock_guard lock(mutex_);
  return ids_.size();
}

} // namespace taskengine::sweeper
