#include "internal/registry/task_registry.hpp"

namespace taskengine::registry {

TaskRegistry::TaskRegistry(std::size_t capacity) : capacity_(capacity) {
}

bool TaskRegistry::Add(TaskHandlePtr handle) {
  std::lock_guard lock(mutex_);

  if (handles_.size() >= capacity_ || handles_.contains(handle->id)) {
    return false;
  }

  const auto key = handle->id;
  handles_.emplace(key, std::move(handle));
  return true;
}

bool TaskRegistry::Remove(const std::string& task_id) {
  std::lock_guard lock(mutex_);
  return handles_.erase(task_id) > 0;
}

TaskHandlePtr TaskRegistry::Find(const std::string& task_id) const {
  std::lock_guard lock(mutex_);

  auto it = handles_.find(task_id);
  if (it == handles_.end()) return nullptr;
  return it->second;
}

std::size_t TaskRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return handles_.size();
}

} // namespace taskengine::registry
