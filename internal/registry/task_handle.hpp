#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/cancellation/cancellation_signal.hpp"
#include "internal/db/model/task_record.hpp"

namespace taskengine::registry {

/*
  In-flight view of a claimed task.

  Immutable apart from `current`, which only the owning worker stores to.
  Readers load it without blocking the worker.
*/
struct TaskHandle {
  TaskHandle(const db::model::TaskRecord& record, std::shared_ptr<cancellation::CancellationSignal> cancel_signal)
      : id(record.id),
        x(record.x),
        y(record.y),
        current(record.current),
        signal(std::move(cancel_signal)) {
  }

  const std::string id;
  const int64_t     x;
  const int64_t     y;

  std::atomic<int64_t> current;

  const std::shared_ptr<cancellation::CancellationSignal> signal;
};

using TaskHandlePtr = std::shared_ptr<TaskHandle>;

} // namespace taskengine::registry
