#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace taskengine::cancellation {

/*
  Cooperative cancellation flag for one task.

  Cancel() is a single atomic store; IsCancelled() never locks. The
  mutex/condvar pair only exists so a worker sleeping out its tick can
  be woken early, either by cancellation or by executor shutdown
  (Interrupt). Interrupt does not cancel.
*/
class CancellationSignal {
 public:
  void Cancel();
  void Interrupt();

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

  bool IsInterrupted() const noexcept {
    return interrupted_.load(std::memory_order_acquire);
  }

  // Sleeps up to `timeout`. Returns true when woken by Cancel/Interrupt.
  bool WaitFor(std::chrono::milliseconds timeout);

 private:
  void Wake();

  std::atomic<bool> cancelled_{false};
  std::atomic<bool> interrupted_{false};

  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace taskengine::cancellation
