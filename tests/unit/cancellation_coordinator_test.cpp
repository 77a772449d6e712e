#include "internal/cancellation/cancellation_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using taskengine::cancellation::CancellationCoordinator;

void TestRegisterIsIdempotent() {
  CancellationCoordinator coordinator;
  auto first  = coordinator.Register("task-a");
  auto second = coordinator.Register("task-a");

  assert(first == second);
  assert(coordinator.Size() == 1);
}

void TestSignalCancelOnlyAffectsRegisteredIds() {
  CancellationCoordinator coordinator;
  auto signal = coordinator.Register("task-a");

  assert(!coordinator.SignalCancel("unknown"));
  assert(!coordinator.IsCancelled("unknown"));

  assert(coordinator.SignalCancel("task-a"));
  assert(signal->IsCancelled());
  assert(coordinator.IsCancelled("task-a"));
  // repeated cancel is harmless
  assert(coordinator.SignalCancel("task-a"));
}

void TestDiscardForgetsSignal() {
  CancellationCoordinator coordinator;
  coordinator.Register("task-a");
  coordinator.Discard("task-a");
  coordinator.Discard("task-a");

  assert(!coordinator.Contains("task-a"));
  assert(!coordinator.Find("task-a"));
  assert(coordinator.Size() == 0);
}

void TestCancelWakesWaiter() {
  CancellationCoordinator coordinator;
  auto signal = coordinator.Register("task-a");

  const auto started = std::chrono::steady_clock::now();
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    coordinator.SignalCancel("task-a");
  });

  const bool woken = signal->WaitFor(std::chrono::seconds(10));
  canceller.join();

  assert(woken);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

void TestWaitTimesOutWithoutSignal() {
  CancellationCoordinator coordinator;
  auto signal = coordinator.Register("task-a");
  assert(!signal->WaitFor(std::chrono::milliseconds(5)));
  assert(!signal->IsCancelled());
}

void TestInterruptAllIsNotCancellation() {
  CancellationCoordinator coordinator;
  auto before = coordinator.Register("task-a");

  coordinator.InterruptAll();
  auto after = coordinator.Register("task-b");

  assert(before->IsInterrupted());
  assert(!before->IsCancelled());
  assert(after->IsInterrupted());
  assert(after->WaitFor(std::chrono::seconds(10)));
}

} // namespace

int main() {
  TestRegisterIsIdempotent();
  TestSignalCancelOnlyAffectsRegisteredIds();
  TestDiscardForgetsSignal();
  TestCancelWakesWaiter();
  TestWaitTimesOutWithoutSignal();
  TestInterruptAllIsNotCancellation();

  std::cout << "task_engine_unit_cancellation_coordinator: pass\n";
  return 0;
}
