#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace taskengine::model {

enum class TaskStatus : std::uint8_t {
  kCreated   = 1,
  kRunning   = 2,
  kCompleted = 3,
  kCancelled = 4,
  kFailed    = 5,
};

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kCancelled || status == TaskStatus::kFailed;
}

/*
  Legal lifecycle edges.

    CREATED -> RUNNING            claim
    CREATED -> CANCELLED | FAILED cancelled or failed before claim
    RUNNING -> terminal           worker finish
    RUNNING -> CREATED            requeue of an orphan during recovery

  Nothing leaves a terminal status.
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (from == to) {
    return !IsTerminal(from);
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (from == TaskStatus::kCreated) {
    return true;
  }
  // from == kRunning
  return to == TaskStatus::kCreated || IsTerminal(to);
}

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kCreated:
      return "CREATED";
    case TaskStatus::kRunning:
      return "RUNNING";
    case TaskStatus::kCompleted:
      return "COMPLETED";
    case TaskStatus::kCancelled:
      return "CANCELLED";
    case TaskStatus::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

inline std::optional<TaskStatus> StatusFromInt(int value) {
  if (value < static_cast<int>(TaskStatus::kCreated) || value > static_cast<int>(TaskStatus::kFailed)) {
    return std::nullopt;
  }
  return static_cast<TaskStatus>(value);
}

inline constexpr TaskStatus kTerminalStatuses[] = {TaskStatus::kCompleted, TaskStatus::kCancelled, TaskStatus::kFailed};

} // namespace taskengine::model
