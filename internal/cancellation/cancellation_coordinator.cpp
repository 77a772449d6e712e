#include "internal/cancellation/cancellation_coordinator.hpp"

#include <mutex>

namespace taskengine::cancellation {

std::shared_ptr<CancellationSignal> CancellationCoordinator::Register(const std::string& task_id) {
  std::unique_lock lock(mutex_);

  auto [it, inserted] = signals_.try_emplace(task_id);
  if (inserted) {
    it->second = std::make_shared<CancellationSignal>();
    if (interrupted_) {
      it->second->Interrupt();
    }
  }
  return it->second;
}

std::shared_ptr<CancellationSignal> CancellationCoordinator::Find(const std::string& task_id) const {
  std::shared_lock lock(mutex_);

  auto it = signals_.find(task_id);
  return it == signals_.end() ? nullptr : it->second;
}

bool CancellationCoordinator::SignalCancel(const std::string& task_id) {
  auto signal = Find(task_id);
  if (!signal) {
    return false;
  }
  signal->Cancel();
  return true;
}

bool CancellationCoordinator::IsCancelled(const std::string& task_id) const {
  auto signal = Find(task_id);
  return signal && signal->IsCancelled();
}

void CancellationCoordinator::Discard(const std::string& task_id) {
  std::unique_lock lock(mutex_);
  signals_.erase(task_id);
}

void CancellationCoordinator::InterruptAll() {
  std::unique_lock lock(mutex_);

  interrupted_ = true;
  for (auto& [id, signal] : signals_) {
    signal->Interrupt();
  }
}

bool CancellationCoordinator::Contains(const std::string& task_id) const {
  std::shared_lock lock(mutex_);
  return signals_.contains(task_id);
}

std::size_t CancellationCoordinator::Size() const {
  std::shared_lock lock(mutex_);
  return signals_.size();
}

} // namespace taskengine::cancellation
