#include "internal/model/task_status.hpp"

#include <cassert>
#include <iostream>

namespace {

using taskengine::model::CanTransition;
using taskengine::model::IsTerminal;
using taskengine::model::StatusFromInt;
using taskengine::model::TaskStatus;

void TestTerminalStatusesAreFinal() {
  for (const auto from : taskengine::model::kTerminalStatuses) {
    assert(IsTerminal(from));
    for (const auto to : {TaskStatus::kCreated, TaskStatus::kRunning, TaskStatus::kCompleted, TaskStatus::kCancelled, TaskStatus::kFailed}) {
      assert(!CanTransition(from, to));
    }
  }
}

void TestLifecycleEdges() {
  assert(CanTransition(TaskStatus::kCreated, TaskStatus::kRunning));
  assert(CanTransition(TaskStatus::kCreated, TaskStatus::kCancelled));
  assert(CanTransition(TaskStatus::kRunning, TaskStatus::kRunning));
  assert(CanTransition(TaskStatus::kRunning, TaskStatus::kCompleted));
  assert(CanTransition(TaskStatus::kRunning, TaskStatus::kCancelled));
  assert(CanTransition(TaskStatus::kRunning, TaskStatus::kFailed));
  assert(CanTransition(TaskStatus::kRunning, TaskStatus::kCreated));
}

void TestStatusFromInt() {
  assert(StatusFromInt(1) == TaskStatus::kCreated);
  assert(StatusFromInt(5) == TaskStatus::kFailed);
  assert(!StatusFromInt(0));
  assert(!StatusFromInt(6));
}

} // namespace

int main() {
  TestTerminalStatusesAreFinal();
  TestLifecycleEdges();
  TestStatusFromInt();

  std::cout << "task_engine_unit_task_status: pass\n";
  return 0;
}
