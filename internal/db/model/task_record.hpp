#pragma once

#include <cstdint>
#include <string>

#include "internal/model/task_status.hpp"

namespace taskengine::db::model {

inline constexpr const char* kCountTaskKind = "count";

/*
  Persistent task row.

  IMPORTANT:
  - current is written only by the worker that claimed the task.
  - version increments on every write; all updates are compare-and-swap.
  - timestamps are unix milliseconds.
*/

struct TaskRecord {
  std::string id;
  std::string kind = kCountTaskKind;

  int64_t x       = 0;
  int64_t y       = 0;
  int64_t current = 0;

  taskengine::model::TaskStatus status = taskengine::model::TaskStatus::kCreated;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  uint64_t version = 0;

  std::string error_message;
};

}
