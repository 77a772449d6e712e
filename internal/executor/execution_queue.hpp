#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "internal/executor/execution_request.hpp"

namespace taskengine::executor {

/*
  Bounded, thread-safe queue between submitters and executor workers.

  Submitters never block: TryEnqueue fails when the queue is full.
  Workers block in Dequeue until work arrives or the queue is shut down.
*/
class ExecutionQueue {
 public:
  explicit ExecutionQueue(std::size_t capacity);

  bool TryEnqueue(ExecutionRequest request);

  // blocking wait; nullopt once shut down
  std::optional<ExecutionRequest> Dequeue();

  // Wakes all workers and returns the requests that were never dequeued.
  std::vector<ExecutionRequest> Shutdown();

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t capacity_;

  mutable std::mutex           mutex_;
  std::condition_variable      cv_;
  std::queue<ExecutionRequest> queue_;
  bool                         shutdown_ = false;
};

} // namespace taskengine::executor
