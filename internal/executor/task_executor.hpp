#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/cancellation/cancellation_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/executor/execution_queue.hpp"
#include "internal/registry/task_registry.hpp"

namespace taskengine::executor {

struct ExecutorOptions {
  std::size_t               worker_count      = 4;
  std::size_t               queue_capacity    = 64;
  std::chrono::milliseconds tick_interval     = std::chrono::milliseconds(1000);
  uint32_t                  flush_every_ticks = 10;
  std::chrono::milliseconds flush_interval    = std::chrono::milliseconds(5000);
};

/*
  Bounded worker pool running the per-task state machine.

    CREATED --claim--> RUNNING --tick...--> COMPLETED
       |                  |
       +--> CANCELLED <---+----> FAILED

  The claiming worker is the only writer of current/status while the task
  runs. current lives in the registry handle and reaches the store at
  claim, every flush_every_ticks ticks or flush_interval (whichever comes
  first), and at every terminal transition.

  Every store write is a compare-and-swap against the last version this
  worker saw. On conflict the worker reloads: a terminal status already
  stored wins and ends the run, anything else is rebased onto.

  Stop() interrupts the tick waits, flushes current for every running
  task (leaving it RUNNING so recovery can resume it) and joins the pool.
*/
class TaskExecutor {
 public:
  TaskExecutor(std::shared_ptr<db::Repository> repository, std::shared_ptr<cancellation::CancellationCoordinator> cancellation,
               std::shared_ptr<registry::TaskRegistry> registry, ExecutorOptions options);
  ~TaskExecutor();

  TaskExecutor(const TaskExecutor&)            = delete;
  TaskExecutor& operator=(const TaskExecutor&) = delete;

  void Start();
  void Stop();

  // Never blocks. Throws util::ResourceExhausted when the queue is full
  // and util::InvalidState once stopped.
  void Submit(const std::string& task_id);

  std::size_t QueueDepth() const;
  std::size_t FreeCapacity() const;

  const ExecutorOptions& Options() const {
    return options_;
  }

 private:
  enum class PersistOutcome {
    kWritten,
    kTerminalInStore,
    kLostOwnership,
    kGone,
  };

  struct TaskRun;

  void Run();
  void RunTask(const ExecutionRequest& request);

  void           CancelBeforeClaim(TaskRun& run);
  PersistOutcome Persist(TaskRun& run, taskengine::model::TaskStatus status, std::string_view reason, bool rebase_on_conflict,
                         const std::string& error_message = {});

  std::shared_ptr<db::Repository>                        repository_;
  std::shared_ptr<cancellation::CancellationCoordinator> cancellation_;
  std::shared_ptr<registry::TaskRegistry>                registry_;
  ExecutorOptions                                        options_;

  ExecutionQueue           queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool>        accepting_{true};
  std::atomic<bool>        stopping_{false};
};

} // namespace taskengine::executor
