#include "internal/cancellation/cancellation_signal.hpp"

namespace taskengine::cancellation {

void CancellationSignal::Cancel() {
  cancelled_.store(true, std::memory_order_release);
  Wake();
}

void CancellationSignal::Interrupt() {
  interrupted_.store(true, std::memory_order_release);
  Wake();
}

void CancellationSignal::Wake() {
  // Taking the lock orders the flag store against a waiter that is
  // between its predicate check and the wait.
  { std::lock_guard lock(mutex_); }
  cv_.notify_all();
}

bool CancellationSignal::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return IsCancelled() || IsInterrupted(); });
}

} // namespace taskengine::cancellation
