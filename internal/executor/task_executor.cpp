#include "internal/executor/task_executor.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace taskengine::executor {

using taskengine::model::IsTerminal;
using taskengine::model::TaskStatus;
using taskengine::observability::IntField;
using taskengine::observability::Metrics;
using taskengine::observability::StringField;
using taskengine::observability::UintField;

namespace {

constexpr int kMaxConflictRetries = 8;

} // namespace

struct TaskExecutor::TaskRun {
  // Last row this worker wrote or reloaded; its version is the CAS base.
  db::model::TaskRecord record;

  // Authoritative counter while running.
  int64_t current = 0;

  std::shared_ptr<cancellation::CancellationSignal> signal;
  registry::TaskHandlePtr                           handle;
  bool                                              registered = false;

  std::chrono::steady_clock::time_point claimed_at;
};

TaskExecutor::TaskExecutor(std::shared_ptr<db::Repository> repository, std::shared_ptr<cancellation::CancellationCoordinator> cancellation,
                           std::shared_ptr<registry::TaskRegistry> registry, ExecutorOptions options)
    : repository_(std::move(repository)),
      cancellation_(std::move(cancellation)),
      registry_(std::move(registry)),
      options_(options),
      queue_(std::max<std::size_t>(1, options.queue_capacity)) {
  options_.worker_count      = std::max<std::size_t>(1, options_.worker_count);
  options_.queue_capacity    = queue_.Capacity();
  options_.flush_every_ticks = std::max<uint32_t>(1, options_.flush_every_ticks);
}

TaskExecutor::~TaskExecutor() {
  Stop();
}

void TaskExecutor::Start() {
  if (!workers_.empty() || stopping_) return;

  workers_.reserve(options_.worker_count);
  for (std::size_t i = 0; i < options_.worker_count; ++i) {
    workers_.emplace_back(&TaskExecutor::Run, this);
  }

  TASKENGINE_LOG_INFO("Task executor started", {UintField("workers", options_.worker_count), UintField("queue_capacity", options_.queue_capacity),
                                                IntField("tick_interval_ms", options_.tick_interval.count())});
}

void TaskExecutor::Stop() {
  accepting_ = false;

  if (!stopping_.exchange(true)) {
    for (const auto& dropped : queue_.Shutdown()) {
      cancellation_->Discard(dropped.task_id);
    }
    cancellation_->InterruptAll();
  }

  if (workers_.empty()) return;

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  TASKENGINE_LOG_INFO("Task executor stopped");
}

void TaskExecutor::Submit(const std::string& task_id) {
  if (!accepting_) {
    throw util::InvalidState("executor is not accepting tasks");
  }

  if (!queue_.TryEnqueue(ExecutionRequest{.task_id = task_id, .enqueued_at_ms = util::NowMillis()})) {
    if (!accepting_) {
      throw util::InvalidState("executor is not accepting tasks");
    }
    throw util::ResourceExhausted("execution queue is full (capacity " + std::to_string(queue_.Capacity()) + ")");
  }
}

std::size_t TaskExecutor::QueueDepth() const {
  return queue_.Size();
}

std::size_t TaskExecutor::FreeCapacity() const {
  const auto depth = queue_.Size();
  return depth >= queue_.Capacity() ? 0 : queue_.Capacity() - depth;
}

void TaskExecutor::Run() {
  while (auto request = queue_.Dequeue()) {
    try {
      RunTask(*request);
    } catch (const std::exception& e) {
      // Only reachable before claim; the record is still CREATED.
      TASKENGINE_LOG_ERROR("Task execution aborted", {StringField("task_id", request->task_id), StringField("error", e.what())});
      cancellation_->Discard(request->task_id);
    }
  }
}

void TaskExecutor::RunTask(const ExecutionRequest& request) {
  const auto& id = request.task_id;

  TaskRun run;
  run.signal = cancellation_->Register(id);

  std::optional<db::model::TaskRecord> loaded;
  {
    auto tx = repository_->Begin();
    loaded  = repository_->GetTask(*tx, id);
    tx->Commit();
  }

  if (!loaded) {
    TASKENGINE_LOG_INFO("Task no longer stored, skipping", {StringField("task_id", id)});
    cancellation_->Discard(id);
    return;
  }
  if (IsTerminal(loaded->status)) {
    TASKENGINE_LOG_INFO("Task already terminal, skipping", {StringField("task_id", id), StringField("status", ToString(loaded->status))});
    cancellation_->Discard(id);
    return;
  }
  if (loaded->status == TaskStatus::kRunning) {
    TASKENGINE_LOG_WARN("Task already owned by another worker", {StringField("task_id", id)});
    return;
  }
  if (stopping_) {
    cancellation_->Discard(id);
    return;
  }

  run.record  = *loaded;
  run.current = loaded->current;

  if (run.signal->IsCancelled()) {
    CancelBeforeClaim(run);
    cancellation_->Discard(id);
    return;
  }

  observability::SpanScope span("task.run");
  span.SetAttribute("task.id", id);

  try {
    const auto claim = Persist(run, TaskStatus::kRunning, "claim", false);
    if (claim != PersistOutcome::kWritten) {
      TASKENGINE_LOG_WARN("Task claim lost", {StringField("task_id", id), StringField("stored_status", ToString(run.record.status))});
      cancellation_->Discard(id);
      return;
    }

    run.claimed_at = std::chrono::steady_clock::now();
    Metrics::Instance().RecordTaskTransition(ToString(TaskStatus::kRunning));
    TASKENGINE_LOG_INFO("Task claimed", {StringField("task_id", id), IntField("x", run.record.x), IntField("y", run.record.y),
                                         IntField("current", run.current), UintField("enqueued_at_ms", request.enqueued_at_ms)});

    run.handle     = std::make_shared<registry::TaskHandle>(run.record, run.signal);
    run.registered = registry_->Add(run.handle);
    if (!run.registered) {
      throw util::InvalidState("task registry rejected task " + id);
    }
    Metrics::Instance().SetInFlightTasks(registry_->Size());

    auto     last_flush        = std::chrono::steady_clock::now();
    uint32_t ticks_since_flush = 0;

    while (true) {
      if (run.current >= run.record.y) {
        Persist(run, TaskStatus::kCompleted, "complete", true);
        break;
      }

      run.signal->WaitFor(options_.tick_interval);

      // Cancellation is checked before advancing so current stays frozen.
      if (run.signal->IsCancelled()) {
        Persist(run, TaskStatus::kCancelled, "cancel", true);
        break;
      }

      if (run.signal->IsInterrupted() || stopping_) {
        Persist(run, TaskStatus::kRunning, "shutdown", true);
        TASKENGINE_LOG_INFO("Task interrupted by shutdown", {StringField("task_id", id), IntField("current", run.current)});
        break;
      }

      ++run.current;
      run.handle->current.store(run.current, std::memory_order_release);
      ++ticks_since_flush;

      if (run.current >= run.record.y) continue;

      const auto now = std::chrono::steady_clock::now();
      if (ticks_since_flush >= options_.flush_every_ticks || now - last_flush >= options_.flush_interval) {
        if (Persist(run, TaskStatus::kRunning, "flush", true) != PersistOutcome::kWritten) {
          break;
        }
        ticks_since_flush = 0;
        last_flush        = now;
      }
    }
  } catch (const std::exception& e) {
    TASKENGINE_LOG_ERROR("Task failed", {StringField("task_id", id), IntField("current", run.current), StringField("error", e.what())});
    span.RecordException(e.what());
    try {
      Persist(run, TaskStatus::kFailed, "fail", true, e.what());
    } catch (const std::exception& write_error) {
      TASKENGINE_LOG_ERROR("Failed to record task failure", {StringField("task_id", id), StringField("error", write_error.what())});
    }
  }

  if (run.registered) {
    registry_->Remove(id);
  }
  cancellation_->Discard(id);
  Metrics::Instance().SetInFlightTasks(registry_->Size());

  if (IsTerminal(run.record.status)) {
    const auto duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - run.claimed_at).count();
    Metrics::Instance().RecordTaskTransition(ToString(run.record.status));
    Metrics::Instance().ObserveTaskDurationMs(ToString(run.record.status), duration_ms);
    span.SetAttribute("task.status", ToString(run.record.status));
    span.SetAttribute("task.current", run.record.current);

    TASKENGINE_LOG_INFO("Task finished", {StringField("task_id", id), StringField("status", ToString(run.record.status)),
                                          IntField("current", run.record.current)});
  }
}

void TaskExecutor::CancelBeforeClaim(TaskRun& run) {
  const auto outcome = Persist(run, TaskStatus::kCancelled, "cancel", false);
  if (outcome == PersistOutcome::kWritten) {
    Metrics::Instance().RecordTaskTransition(ToString(TaskStatus::kCancelled));
    TASKENGINE_LOG_INFO("Task cancelled before claim", {StringField("task_id", run.record.id)});
  }
}

TaskExecutor::PersistOutcome TaskExecutor::Persist(TaskRun& run, TaskStatus status, std::string_view reason, bool rebase_on_conflict,
                                                   const std::string& error_message) {
  for (int attempt = 0; attempt < kMaxConflictRetries; ++attempt) {
    if (!taskengine::model::CanTransition(run.record.status, status)) {
      throw util::InvalidState("illegal task transition " + std::string(ToString(run.record.status)) + " -> " + std::string(ToString(status)));
    }

    auto next          = run.record;
    next.current       = std::max(run.current, run.record.current);
    next.status        = status;
    next.updated_at_ms = util::NowMillis();
    next.version       = run.record.version + 1;
    if (!error_message.empty()) {
      next.error_message = error_message;
    }

    auto tx     = repository_->Begin();
    auto result = repository_->CompareAndSwapTask(*tx, next, run.record.version);
    if (result) {
      tx->Commit();
      run.record  = next;
      run.current = next.current;
      Metrics::Instance().RecordStoreWrite(reason);
      return PersistOutcome::kWritten;
    }

    if (result.code == db::ErrorCode::NotFound) {
      tx->Rollback();
      TASKENGINE_LOG_WARN("Task disappeared from store", {StringField("task_id", run.record.id), StringField("write", reason)});
      return PersistOutcome::kGone;
    }

    if (!result.IsConflict()) {
      throw std::runtime_error("task write failed (" + std::string(db::ToString(result.code)) + "): " + result.message);
    }

    auto stored = repository_->GetTask(*tx, run.record.id);
    tx->Rollback();

    if (!stored) {
      return PersistOutcome::kGone;
    }

    TASKENGINE_LOG_WARN("Task version conflict", {StringField("task_id", run.record.id), StringField("write", reason),
                                                  UintField("expected_version", run.record.version), UintField("stored_version", stored->version),
                                                  StringField("stored_status", ToString(stored->status))});

    run.record = *stored;
    if (IsTerminal(stored->status)) {
      return PersistOutcome::kTerminalInStore;
    }
    if (!rebase_on_conflict) {
      return PersistOutcome::kLostOwnership;
    }
    run.current = std::max(run.current, stored->current);
  }

  throw std::runtime_error("task " + run.record.id + ": version conflict persisted after " + std::to_string(kMaxConflictRetries) + " attempts");
}

} // namespace taskengine::executor
