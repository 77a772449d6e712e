#include "internal/core/task_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace taskengine::core {

using taskengine::model::IsTerminal;
using taskengine::model::TaskStatus;
using taskengine::observability::IntField;
using taskengine::observability::StringField;
using taskengine::observability::UintField;

namespace {

constexpr int kMaxCancelAttempts = 8;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

TaskManager::TaskManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<cancellation::CancellationCoordinator> cancellation,
                         std::shared_ptr<registry::TaskRegistry> registry, std::shared_ptr<executor::TaskExecutor> executor,
                         std::shared_ptr<sweeper::TombstoneLog> tombstones, ManagerOptions options)
    : repository_(std::move(repository)),
      cancellation_(std::move(cancellation)),
      registry_(std::move(registry)),
      executor_(std::move(executor)),
      tombstones_(std::move(tombstones)),
      options_(options) {
}

void TaskManager::ValidateRange(int64_t x, int64_t y) const {
  if (y < x) {
    throw util::InvalidRange("y (" + std::to_string(y) + ") must not be below x (" + std::to_string(x) + ")");
  }

  // y >= x, so the unsigned difference is exact
  const uint64_t span = static_cast<uint64_t>(y) - static_cast<uint64_t>(x);
  if (span > options_.max_range_span) {
    throw util::InvalidRange("range span " + std::to_string(span) + " exceeds maximum " + std::to_string(options_.max_range_span));
  }
}

std::string TaskManager::Submit(int64_t x, int64_t y) {
  ValidateRange(x, y);

  const auto now_ms = util::NowMillis();

  db::model::TaskRecord record;
  record.id            = util::GenerateUUIDString();
  record.kind          = db::model::kCountTaskKind;
  record.x             = x;
  record.y             = y;
  record.current       = x;
  record.status        = TaskStatus::kCreated;
  record.created_at_ms = now_ms;
  record.updated_at_ms = now_ms;
  record.version       = 1;

  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertTask(*tx, record), "insert task");
    tx->Commit();
  }
  observability::Metrics::Instance().RecordTaskTransition(ToString(TaskStatus::kCreated));

  cancellation_->Register(record.id);

  try {
    executor_->Submit(record.id);
  } catch (const std::exception& e) {
    TASKENGINE_LOG_WARN("Task rejected by executor", {StringField("task_id", record.id), StringField("error", e.what())});
    cancellation_->Discard(record.id);

    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteTask(*tx, record.id), "delete rejected task");
    tx->Commit();
    throw;
  }

  TASKENGINE_LOG_INFO("Task submitted", {StringField("task_id", record.id), IntField("x", x), IntField("y", y)});
  return record.id;
}

TaskProgress TaskManager::GetProgress(const std::string& task_id) {
  if (auto handle = registry_->Find(task_id)) {
    TaskProgress progress;
    progress.id         = handle->id;
    progress.x          = handle->x;
    progress.y          = handle->y;
    progress.current    = handle->current.load(std::memory_order_acquire);
    progress.status     = TaskStatus::kRunning;
    progress.percentage = Percentage(progress.x, progress.y, progress.current);
    return progress;
  }

  std::optional<db::model::TaskRecord> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetTask(*tx, task_id);
    tx->Commit();
  }

  if (!record) {
    throw util::NotFound("task not found: " + task_id);
  }
  return MakeProgress(*record);
}

CancelOutcome TaskManager::Cancel(const std::string& task_id) {
  if (registry_->Find(task_id) && cancellation_->SignalCancel(task_id)) {
    TASKENGINE_LOG_INFO("Task cancellation signalled", {StringField("task_id", task_id)});
    return CancelOutcome::kSignalled;
  }

  // Queued or idle in the store. The signal stops a worker that claims it
  // concurrently; the store write is what makes the cancel stick.
  const bool signalled = cancellation_->SignalCancel(task_id);

  for (int attempt = 0; attempt < kMaxCancelAttempts; ++attempt) {
    auto tx     = repository_->Begin();
    auto stored = repository_->GetTask(*tx, task_id);

    if (!stored) {
      tx->Rollback();
      if (tombstones_ && tombstones_->Contains(task_id)) {
        return CancelOutcome::kAlreadyDeleted;
      }
      throw util::NotFound("task not found: " + task_id);
    }

    if (IsTerminal(stored->status)) {
      tx->Rollback();
      return CancelOutcome::kAlreadyTerminal;
    }

    if (stored->status == TaskStatus::kRunning && signalled) {
      // claimed since the registry lookup; the worker writes CANCELLED
      tx->Rollback();
      TASKENGINE_LOG_INFO("Task cancellation signalled", {StringField("task_id", task_id)});
      return CancelOutcome::kSignalled;
    }

    auto next          = *stored;
    next.status        = TaskStatus::kCancelled;
    next.updated_at_ms = util::NowMillis();
    next.version       = stored->version + 1;

    auto result = repository_->CompareAndSwapTask(*tx, next, stored->version);
    if (result.IsConflict()) {
      tx->Rollback();
      continue;
    }
    ThrowIfDbError(result, "cancel task");
    tx->Commit();

    observability::Metrics::Instance().RecordTaskTransition(ToString(TaskStatus::kCancelled));
    observability::Metrics::Instance().RecordStoreWrite("cancel");
    TASKENGINE_LOG_INFO("Task cancelled in store", {StringField("task_id", task_id), StringField("previous_status", ToString(stored->status)),
                                                    IntField("current", stored->current)});
    return CancelOutcome::kCancelled;
  }

  throw util::InvalidState("cancel of task " + task_id + " kept conflicting");
}

RecoveryReport TaskManager::Recover() {
  RecoveryReport report;

  std::vector<db::model::TaskRecord> orphans;
  {
    auto tx = repository_->Begin();
    orphans = repository_->ListTasksByStatus(*tx, TaskStatus::kRunning);
    tx->Commit();
  }

  for (const auto& orphan : orphans) {
    if (registry_->Find(orphan.id)) continue;

    auto next          = orphan;
    next.status        = TaskStatus::kCreated;
    next.updated_at_ms = util::NowMillis();
    next.version       = orphan.version + 1;

    auto tx     = repository_->Begin();
    auto result = repository_->CompareAndSwapTask(*tx, next, orphan.version);
    if (!result) {
      tx->Rollback();
      TASKENGINE_LOG_WARN("Orphaned task changed during recovery", {StringField("task_id", orphan.id), StringField("error", db::ToString(result.code))});
      continue;
    }
    tx->Commit();
    ++report.orphans_requeued;
  }

  std::vector<db::model::TaskRecord> pending;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListTasksByStatus(*tx, TaskStatus::kCreated);
    tx->Commit();
  }

  std::sort(pending.begin(), pending.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });

  for (const auto& task : pending) {
    if (cancellation_->Contains(task.id)) continue;

    if (executor_->FreeCapacity() == 0) {
      ++report.deferred;
      continue;
    }

    cancellation_->Register(task.id);
    try {
      executor_->Submit(task.id);
      ++report.enqueued;
    } catch (const util::ResourceExhausted&) {
      cancellation_->Discard(task.id);
      ++report.deferred;
    }
  }

  TASKENGINE_LOG_INFO("Task recovery finished", {UintField("orphans_requeued", report.orphans_requeued), UintField("enqueued", report.enqueued),
                                                 UintField("deferred", report.deferred)});
  return report;
}

TaskStats TaskManager::Stats() {
  TaskStats stats;
  {
    auto tx         = repository_->Begin();
    stats.created   = repository_->CountTasks(*tx, TaskStatus::kCreated);
    stats.running   = repository_->CountTasks(*tx, TaskStatus::kRunning);
    stats.completed = repository_->CountTasks(*tx, TaskStatus::kCompleted);
    stats.cancelled = repository_->CountTasks(*tx, TaskStatus::kCancelled);
    stats.failed    = repository_->CountTasks(*tx, TaskStatus::kFailed);
    tx->Commit();
  }
  stats.in_flight = registry_->Size();
  stats.queued    = executor_->QueueDepth();
  return stats;
}

} // namespace taskengine::core
