#include "internal/executor/task_executor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using taskengine::db::model::TaskRecord;
using taskengine::executor::ExecutorOptions;
using taskengine::executor::TaskExecutor;
using taskengine::model::TaskStatus;

/*
  Forwards to a memory store, counting compare-and-swap writes and
  optionally failing one of them.
*/
class InstrumentedRepository final : public taskengine::db::Repository {
 public:
  std::unique_ptr<taskengine::db::Transaction> Begin() override {
    return inner_.Begin();
  }

  taskengine::db::Result InsertTask(taskengine::db::Transaction& tx, const TaskRecord& r) override {
    return inner_.InsertTask(tx, r);
  }

  std::optional<TaskRecord> GetTask(taskengine::db::Transaction& tx, const std::string& id) override {
    return inner_.GetTask(tx, id);
  }

  taskengine::db::Result CompareAndSwapTask(taskengine::db::Transaction& tx, const TaskRecord& r, uint64_t expected_version) override {
    const auto call = ++cas_calls;
    if (fail_on_call != 0 && call == fail_on_call) {
      return taskengine::db::Result::Err(taskengine::db::ErrorCode::IOError, "injected write failure");
    }
    return inner_.CompareAndSwapTask(tx, r, expected_version);
  }

  taskengine::db::Result DeleteTask(taskengine::db::Transaction& tx, const std::string& id) override {
    return inner_.DeleteTask(tx, id);
  }

  std::vector<TaskRecord> FindByStatusOlderThan(taskengine::db::Transaction& tx, TaskStatus status, taskengine::db::AgeField field,
                                                uint64_t cutoff_ms) override {
    return inner_.FindByStatusOlderThan(tx, status, field, cutoff_ms);
  }

  std::vector<TaskRecord> ListTasksByStatus(taskengine::db::Transaction& tx, TaskStatus status) override {
    return inner_.ListTasksByStatus(tx, status);
  }

  uint64_t CountTasks(taskengine::db::Transaction& tx, TaskStatus status) override {
    return inner_.CountTasks(tx, status);
  }

  std::atomic<uint64_t> cas_calls{0};
  uint64_t              fail_on_call = 0;

 private:
  taskengine::db::memory::MemoryRepository inner_;
};

struct Fixture {
  explicit Fixture(ExecutorOptions options)
      : repository(std::make_shared<InstrumentedRepository>()),
        cancellation(std::make_shared<taskengine::cancellation::CancellationCoordinator>()),
        registry(std::make_shared<taskengine::registry::TaskRegistry>(options.worker_count)),
        executor(std::make_shared<TaskExecutor>(repository, cancellation, registry, options)) {
  }

  std::string Insert(int64_t x, int64_t y) {
    TaskRecord record;
    record.id            = taskengine::util::GenerateUUIDString();
    record.x             = x;
    record.y             = y;
    record.current       = x;
    record.created_at_ms = taskengine::util::NowMillis();
    record.updated_at_ms = record.created_at_ms;
    record.version       = 1;

    auto       tx       = repository->Begin();
    const auto inserted = repository->InsertTask(*tx, record);
    assert(inserted);
    tx->Commit();

    cancellation->Register(record.id);
    return record.id;
  }

  TaskRecord Load(const std::string& id) {
    auto tx     = repository->Begin();
    auto record = repository->GetTask(*tx, id);
    tx->Commit();
    assert(record);
    return *record;
  }

  std::shared_ptr<InstrumentedRepository>                            repository;
  std::shared_ptr<taskengine::cancellation::CancellationCoordinator> cancellation;
  std::shared_ptr<taskengine::registry::TaskRegistry>                registry;
  std::shared_ptr<TaskExecutor>                                      executor;
};

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

ExecutorOptions FastOptions() {
  ExecutorOptions options;
  options.worker_count      = 2;
  options.queue_capacity    = 8;
  options.tick_interval     = std::chrono::milliseconds(1);
  options.flush_every_ticks = 10;
  options.flush_interval    = std::chrono::hours(1);
  return options;
}

void TestTaskRunsToCompletion() {
  Fixture fx(FastOptions());
  fx.executor->Start();

  const auto id = fx.Insert(5, 12);
  fx.executor->Submit(id);

  assert(WaitUntil([&] { return fx.Load(id).status == TaskStatus::kCompleted; }));
  assert(WaitUntil([&] { return fx.registry->Size() == 0; }));

  const auto record = fx.Load(id);
  assert(record.current == 12);
  assert(record.error_message.empty());
  assert(WaitUntil([&] { return !fx.cancellation->Contains(id); }));
}

void TestEmptyRangeCompletesImmediately() {
  Fixture fx(FastOptions());
  fx.executor->Start();

  const auto id = fx.Insert(3, 3);
  fx.executor->Submit(id);

  assert(WaitUntil([&] { return fx.Load(id).status == TaskStatus::kCompleted; }));
  assert(fx.Load(id).current == 3);
}

void TestStoreWritesAreThrottled() {
  Fixture fx(FastOptions());
  fx.executor->Start();

  const auto id = fx.Insert(0, 25);
  fx.executor->Submit(id);

  assert(WaitUntil([&] { return fx.Load(id).status == TaskStatus::kCompleted; }));
  assert(WaitUntil([&] { return fx.registry->Size() == 0; }));

  // claim, flushes at 10 and 20, completion
  assert(fx.repository->cas_calls.load() == 4);
}

void TestCancelFreezesCurrent() {
  auto options          = FastOptions();
  options.tick_interval = std::chrono::milliseconds(10);
  Fixture fx(options);
  fx.executor->Start();

  const auto id = fx.Insert(0, 1'000'000);
  fx.executor->Submit(id);

  assert(WaitUntil([&] {
    auto handle = fx.registry->Find(id);
    return handle && handle->current.load() >= 2;
  }));

  assert(fx.cancellation->SignalCancel(id));
  assert(WaitUntil([&] { return fx.Load(id).status == TaskStatus::kCancelled; }));

  const auto frozen = fx.Load(id).current;
  assert(frozen >= 2);
  assert(frozen < 1'000'000);

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(fx.Load(id).current == frozen);
  assert(fx.Load(id).status == TaskStatus::kCancelled);
}

void TestCancelledBeforeClaimNeverRuns() {
  Fixture fx(FastOptions());

  const auto id = fx.Insert(0, 100);
  fx.executor->Submit(id);
  assert(fx.cancellation->SignalCancel(id));

  fx.executor->Start();
  assert(WaitUntil([&] { return fx.Load(id).status == TaskStatus::kCancelled; }));
  assert(fx.Load(id).current == 0);
}

void TestWriteFailureMarksTaskFailed() {
  Fixture fx(FastOptions());
  // call 1 is the claim, call 2 the first flush
  fx.repository->fail_on_call = 2;
  fx.executor->Start();

  const auto id = fx.Insert(0, 50);
  fx.executor->Submit(id);

  assert(WaitUntil([&] { return fx.Load(id).status == TaskStatus::kFailed; }));
  assert(WaitUntil([&] { return fx.registry->Size() == 0; }));

  const auto record = fx.Load(id);
  assert(!record.error_message.empty());
  assert(record.current >= 10);
  assert(WaitUntil([&] { return !fx.cancellation->Contains(id); }));
}

void TestTerminalStatusInStoreWins() {
  auto options              = FastOptions();
  options.flush_every_ticks = 1;
  Fixture fx(options);
  fx.executor->Start();

  const auto id = fx.Insert(0, 1'000'000);
  fx.executor->Submit(id);
  assert(WaitUntil([&] { return fx.registry->Find(id) != nullptr; }));

  // another writer finalizes the row behind the worker's back
  bool written = false;
  for (int attempt = 0; attempt < 100 && !written; ++attempt) {
    auto tx     = fx.repository->Begin();
    auto stored = fx.repository->GetTask(*tx, id);
    assert(stored);

    auto next          = *stored;
    next.status        = TaskStatus::kFailed;
    next.error_message = "external";
    next.version       = stored->version + 1;
    written            = static_cast<bool>(fx.repository->CompareAndSwapTask(*tx, next, stored->version));
    if (written) {
      tx->Commit();
    } else {
      tx->Rollback();
    }
  }
  assert(written);

  assert(WaitUntil([&] { return fx.registry->Size() == 0; }));
  const auto record = fx.Load(id);
  assert(record.status == TaskStatus::kFailed);
  assert(record.error_message == "external");
}

void TestFullQueueRejectsSubmission() {
  auto options           = FastOptions();
  options.queue_capacity = 1;
  Fixture fx(options);

  fx.executor->Submit(fx.Insert(0, 10));
  assert(fx.executor->FreeCapacity() == 0);

  bool rejected = false;
  try {
    fx.executor->Submit(fx.Insert(0, 10));
  } catch (const taskengine::util::ResourceExhausted&) {
    rejected = true;
  }
  assert(rejected);
  assert(fx.executor->QueueDepth() == 1);
}

void TestStopFlushesAndLeavesRunning() {
  auto options              = FastOptions();
  options.tick_interval     = std::chrono::milliseconds(5);
  options.flush_every_ticks = 1'000'000;
  Fixture fx(options);
  fx.executor->Start();

  const auto id = fx.Insert(0, 1'000'000);
  fx.executor->Submit(id);
  assert(WaitUntil([&] {
    auto handle = fx.registry->Find(id);
    return handle && handle->current.load() >= 3;
  }));

  fx.executor->Stop();

  const auto record = fx.Load(id);
  assert(record.status == TaskStatus::kRunning);
  assert(record.current >= 3);
  assert(fx.registry->Size() == 0);
  assert(!fx.cancellation->Contains(id));

  bool refused = false;
  try {
    fx.executor->Submit(fx.Insert(0, 10));
  } catch (const taskengine::util::InvalidState&) {
    refused = true;
  }
  assert(refused);
}

} // namespace

int main() {
  TestTaskRunsToCompletion();
  TestEmptyRangeCompletesImmediately();
  TestStoreWritesAreThrottled();
  TestCancelFreezesCurrent();
  TestCancelledBeforeClaimNeverRuns();
  TestWriteFailureMarksTaskFailed();
  TestTerminalStatusInStoreWins();
  TestFullQueueRejectsSubmission();
  TestStopFlushesAndLeavesRunning();

  std::cout << "task_engine_unit_task_executor: pass\n";
  return 0;
}
