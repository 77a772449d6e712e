#include "internal/executor/execution_queue.hpp"

namespace taskengine::executor {

ExecutionQueue::ExecutionQueue(std::size_t capacity) : capacity_(capacity) {
}

bool ExecutionQueue::TryEnqueue(ExecutionRequest request) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) {
      return false;
    }
    queue_.push(std::move(request));
  }
  cv_.notify_one();
  return true;
}

std::optional<ExecutionRequest> ExecutionQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  ExecutionRequest request = std::move(queue_.front());
  queue_.pop();
  return request;
}

std::vector<ExecutionRequest> ExecutionQueue::Shutdown() {
  std::vector<ExecutionRequest> dropped;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    while (!queue_.empty()) {
      dropped.push_back(std::move(queue_.front()));
      queue_.pop();
    }
  }
  cv_.notify_all();
  return dropped;
}

std::size_t ExecutionQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace taskengine::executor
