#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/cancellation/cancellation_signal.hpp"

namespace taskengine::cancellation {

/*
  task id -> cancellation signal.

  Entries exist from submission until the task reaches a terminal status
  or is abandoned by its worker, so the map is bounded by queued plus
  in-flight tasks. The coordinator owns no task data.
*/
class CancellationCoordinator {
 public:
  // Returns the existing signal when the id is already registered.
  std::shared_ptr<CancellationSignal> Register(const std::string& task_id);

  std::shared_ptr<CancellationSignal> Find(const std::string& task_id) const;

  // true when a registered signal was set. Unknown ids are a no-op.
  bool SignalCancel(const std::string& task_id);

  bool IsCancelled(const std::string& task_id) const;

  void Discard(const std::string& task_id);

  // Wakes every waiter for shutdown. Signals registered afterwards start
  // interrupted.
  void InterruptAll();

  bool        Contains(const std::string& task_id) const;
  std::size_t Size() const;

 private:
  mutable std::shared_mutex                                            mutex_;
  std::unordered_map<std::string, std::shared_ptr<CancellationSignal>> signals_;
  bool                                                                 interrupted_ = false;
};

} // namespace taskengine::cancellation
