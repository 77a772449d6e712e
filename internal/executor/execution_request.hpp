#pragma once

#include <cstdint>
#include <string>

namespace taskengine::executor {

struct ExecutionRequest {
  std::string task_id;
  uint64_t    enqueued_at_ms = 0;
};

} // namespace taskengine::executor
