#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/registry/task_handle.hpp"

namespace taskengine::registry {

/*
  Index of tasks currently owned by an executor worker.

  Bounded by the worker pool size, never by total task count. An entry is
  added once at claim and removed once by the same worker when it stops
  owning the task.
*/
class TaskRegistry {
 public:
  explicit TaskRegistry(std::size_t capacity);

  // false when the id is already present or the registry is full.
  bool Add(TaskHandlePtr handle);

  bool Remove(const std::string& task_id);

  TaskHandlePtr Find(const std::string& task_id) const;

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t capacity_;

  mutable std::mutex                             mutex_;
  std::unordered_map<std::string, TaskHandlePtr> handles_;
};

} // namespace taskengine::registry
