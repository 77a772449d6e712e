#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/cancellation/cancellation_coordinator.hpp"
#include "internal/core/progress.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/executor/task_executor.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/sweeper/tombstone_log.hpp"

namespace taskengine::core {

enum class CancelOutcome {
  kSignalled,        // running; the owning worker writes CANCELLED
  kCancelled,        // queued or idle; CANCELLED written directly
  kAlreadyTerminal,  // no-op
  kAlreadyDeleted,   // swept recently; no-op
};

struct RecoveryReport {
  uint64_t orphans_requeued = 0;
  uint64_t enqueued         = 0;
  uint64_t deferred         = 0;
};

struct TaskStats {
  uint64_t created   = 0;
  uint64_t running   = 0;
  uint64_t completed = 0;
  uint64_t cancelled = 0;
  uint64_t failed    = 0;
  uint64_t in_flight = 0;
  uint64_t queued    = 0;
};

struct ManagerOptions {
  uint64_t max_range_span = 1'000'000;
};

/*
  Entry point for task submission, progress, cancellation and startup
  recovery.

  Progress reads prefer the registry (latest in-memory current) and fall
  back to the store. Cancelling a running task only sets its signal and
  the owning worker writes CANCELLED. Anything else, queued tasks
  included, is swapped to CANCELLED in the store right away; a worker
  that dequeues it later loses its claim to the terminal row.
*/
class TaskManager {
 public:
  TaskManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<cancellation::CancellationCoordinator> cancellation,
              std::shared_ptr<registry::TaskRegistry> registry, std::shared_ptr<executor::TaskExecutor> executor,
              std::shared_ptr<sweeper::TombstoneLog> tombstones, ManagerOptions options);

  // Throws util::InvalidRange (nothing persisted) or util::ResourceExhausted.
  std::string Submit(int64_t x, int64_t y);

  // Throws util::NotFound.
  TaskProgress GetProgress(const std::string& task_id);

  // Throws util::NotFound only for ids that were never valid.
  CancelOutcome Cancel(const std::string& task_id);

  RecoveryReport Recover();

  TaskStats Stats();

 private:
  void ValidateRange(int64_t x, int64_t y) const;

  std::shared_ptr<db::Repository>                        repository_;
  std::shared_ptr<cancellation::CancellationCoordinator> cancellation_;
  std::shared_ptr<registry::TaskRegistry>                registry_;
  std::shared_ptr<executor::TaskExecutor>                executor_;
  std::shared_ptr<sweeper::TombstoneLog>                 tombstones_;
  ManagerOptions                                         options_;
};

constexpr const char* ToString(CancelOutcome outcome) {
  switch (outcome) {
    case CancelOutcome::kSignalled:
      return "signalled";
    case CancelOutcome::kCancelled:
      return "cancelled";
    case CancelOutcome::kAlreadyTerminal:
      return "already_terminal";
    case CancelOutcome::kAlreadyDeleted:
      return "already_deleted";
  }
  return "unknown";
}

} // namespace taskengine::core
