#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

#include "internal/db/model/task_record.hpp"
#include "internal/model/task_status.hpp"

namespace taskengine::core {

/*
  Reportable view of a task.

  Built from the registry handle while a worker owns the task, from the
  stored record otherwise. percentage is always derived, never stored.
*/
struct TaskProgress {
  std::string id;

  int64_t x       = 0;
  int64_t y       = 0;
  int64_t current = 0;

  taskengine::model::TaskStatus status = taskengine::model::TaskStatus::kCreated;

  double percentage = 0.0;

  std::string error_message;
};

// ((current - x) / max(1, y - x)) * 100, clamped to [0, 100].
inline double Percentage(int64_t x, int64_t y, int64_t current) {
  const double span     = std::max(1.0, static_cast<double>(y) - static_cast<double>(x));
  const double advanced = static_cast<double>(current) - static_cast<double>(x);
  return std::clamp(advanced / span * 100.0, 0.0, 100.0);
}

// A completed task reports 100 even when x == y.
inline double Percentage(int64_t x, int64_t y, int64_t current, taskengine::model::TaskStatus status) {
  if (status == taskengine::model::TaskStatus::kCompleted) {
    return 100.0;
  }
  return Percentage(x, y, current);
}

inline TaskProgress MakeProgress(const db::model::TaskRecord& record) {
  TaskProgress progress;
  progress.id            = record.id;
  progress.x             = record.x;
  progress.y             = record.y;
  progress.current       = record.current;
  progress.status        = record.status;
  progress.percentage    = Percentage(record.x, record.y, record.current, record.status);
  progress.error_message = record.error_message;
  return progress;
}

} // namespace taskengine::core
