#include "internal/sweeper/staleness_sweeper.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>

#include "internal/artifacts/disk_artifact_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace std::chrono_literals;

using taskengine::db::model::TaskRecord;
using taskengine::model::TaskStatus;
using taskengine::sweeper::StalenessSweeper;
using taskengine::sweeper::SweepThresholds;

constexpr uint64_t kNowMs  = 10ull * 24 * 60 * 60 * 1000;
constexpr uint64_t kHourMs = 60ull * 60 * 1000;

/*
  Memory store that remembers whether each deleted id was already
  tombstoned when its row was removed.
*/
class TombstoneCheckingRepository final : public taskengine::db::Repository {
 public:
  explicit TombstoneCheckingRepository(std::shared_ptr<taskengine::sweeper::TombstoneLog> tombstones) : tombstones_(std::move(tombstones)) {
  }

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
    return inner_.CompareAndSwapTask(tx, r, expected_version);
  }

  taskengine::db::Result DeleteTask(taskengine::db::Transaction& tx, const std::string& id) override {
    ++deletes;
    if (!tombstones_->Contains(id)) ++deletes_without_tombstone;
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

  int deletes                   = 0;
  int deletes_without_tombstone = 0;

 private:
  std::shared_ptr<taskengine::sweeper::TombstoneLog> tombstones_;
  taskengine::db::memory::MemoryRepository           inner_;
};

class ThrowingArtifactStore final : public taskengine::artifacts::ArtifactStore {
 public:
  void ReleaseArtifacts(const std::string& task_id) override {
    throw std::runtime_error("cannot release " + task_id);
  }
};

struct Harness {
  Harness()
      : repository(std::make_shared<taskengine::db::memory::MemoryRepository>()),
        registry(std::make_shared<taskengine::registry::TaskRegistry>(4)),
        cancellation(std::make_shared<taskengine::cancellation::CancellationCoordinator>()),
        tombstones(std::make_shared<taskengine::sweeper::TombstoneLog>(16)) {
  }

  std::unique_ptr<StalenessSweeper> MakeSweeper(const SweepThresholds& thresholds, taskengine::artifacts::ArtifactStorePtr artifacts = nullptr) {
    return std::make_unique<StalenessSweeper>(repository, registry, cancellation, tombstones,
                                              StalenessSweeper::DefaultRules(thresholds, std::move(artifacts)), 1h);
  }

  TaskRecord Store(TaskStatus status, uint64_t created_at_ms, uint64_t updated_at_ms, const std::string& kind = "count") {
    return Store(MakeRecord(status, created_at_ms, updated_at_ms, kind));
  }

  TaskRecord Store(const TaskRecord& record) {
    auto       tx       = repository->Begin();
    const auto inserted = repository->InsertTask(*tx, record);
    assert(inserted);
    tx->Commit();
    return record;
  }

  static TaskRecord MakeRecord(TaskStatus status, uint64_t created_at_ms, uint64_t updated_at_ms, const std::string& kind = "count") {
    TaskRecord record;
    record.id            = taskengine::util::GenerateUUIDString();
    record.kind          = kind;
    record.x             = 0;
    record.y             = 10;
    record.status        = status;
    record.created_at_ms = created_at_ms;
    record.updated_at_ms = updated_at_ms;
    record.version       = 1;
    return record;
  }

  std::optional<TaskRecord> Load(const std::string& id) {
    auto tx     = repository->Begin();
    auto record = repository->GetTask(*tx, id);
    tx->Commit();
    return record;
  }

  std::shared_ptr<taskengine::db::memory::MemoryRepository>          repository;
  std::shared_ptr<taskengine::registry::TaskRegistry>                registry;
  std::shared_ptr<taskengine::cancellation::CancellationCoordinator> cancellation;
  std::shared_ptr<taskengine::sweeper::TombstoneLog>                 tombstones;
};

void TestUnstartedTasksExpireByCreationTime() {
  Harness h;
  auto    sweeper = h.MakeSweeper(SweepThresholds{});

  const auto stale = h.Store(TaskStatus::kCreated, kNowMs - 2 * kHourMs, kNowMs - 2 * kHourMs);
  const auto fresh = h.Store(TaskStatus::kCreated, kNowMs - kHourMs / 2, kNowMs - kHourMs / 2);

  const auto report = sweeper->SweepOnce(kNowMs);
  assert(report.deleted == 1);
  assert(report.errors == 0);

  assert(!h.Load(stale.id));
  assert(h.Load(fresh.id));
  assert(h.tombstones->Contains(stale.id));
  assert(!h.tombstones->Contains(fresh.id));
}

void TestQueuedTasksAreNotSwept() {
  Harness h;
  auto    sweeper = h.MakeSweeper(SweepThresholds{});

  const auto queued = h.Store(TaskStatus::kCreated, kNowMs - 2 * kHourMs, kNowMs - 2 * kHourMs);
  h.cancellation->Register(queued.id);

  const auto report = sweeper->SweepOnce(kNowMs);
  assert(report.deleted == 0);
  assert(h.Load(queued.id));
  assert(!h.tombstones->Contains(queued.id));
}

void TestRecoveredTasksAreNotSweptAsUnstarted() {
  Harness h;
  auto    sweeper = h.MakeSweeper(SweepThresholds{});

  // created -> running -> created again by recovery
  auto requeued    = Harness::MakeRecord(TaskStatus::kCreated, kNowMs - 2 * kHourMs, kNowMs - 2 * kHourMs);
  requeued.version = 3;
  h.Store(requeued);

  // progress alone marks a row as claimed
  auto advanced    = Harness::MakeRecord(TaskStatus::kCreated, kNowMs - 2 * kHourMs, kNowMs - 2 * kHourMs);
  advanced.current = 5;
  h.Store(advanced);

  const auto never_claimed = h.Store(TaskStatus::kCreated, kNowMs - 2 * kHourMs, kNowMs - 2 * kHourMs);

  const auto report = sweeper->SweepOnce(kNowMs);
  assert(report.deleted == 1);
  assert(h.Load(requeued.id));
  assert(h.Load(advanced.id)->current == 5);
  assert(!h.Load(never_claimed.id));
}

void TestTombstoneIsRecordedBeforeDelete() {
  auto tombstones = std::make_shared<taskengine::sweeper::TombstoneLog>(16);
  auto repository = std::make_shared<TombstoneCheckingRepository>(tombstones);

  StalenessSweeper sweeper(repository, std::make_shared<taskengine::registry::TaskRegistry>(1),
                           std::make_shared<taskengine::cancellation::CancellationCoordinator>(), tombstones,
                           StalenessSweeper::DefaultRules(SweepThresholds{}, nullptr), 1h);

  for (const auto status : {TaskStatus::kCreated, TaskStatus::kCompleted}) {
    auto       tx       = repository->Begin();
    const auto inserted = repository->InsertTask(*tx, Harness::MakeRecord(status, kNowMs - 30 * kHourMs, kNowMs - 30 * kHourMs));
    assert(inserted);
    tx->Commit();
  }

  const auto report = sweeper.SweepOnce(kNowMs);
  assert(report.deleted == 2);
  assert(repository->deletes == 2);
  assert(repository->deletes_without_tombstone == 0);
}

void TestRunningTasksAreKeptWithoutAbandonedRule() {
  Harness h;
  auto    sweeper = h.MakeSweeper(SweepThresholds{});

  const auto running = h.Store(TaskStatus::kRunning, kNowMs - 48 * kHourMs, kNowMs - 48 * kHourMs);

  const auto report = sweeper->SweepOnce(kNowMs);
  assert(report.deleted == 0);
  assert(report.failed == 0);
  assert(h.Load(running.id)->status == TaskStatus::kRunning);
}

void TestTerminalRetentionReleasesArtifacts() {
  Harness    h;
  const auto root = std::filesystem::temp_directory_path() / "task_engine_sweeper_tests" / "retention";
  std::filesystem::remove_all(root);
  auto artifacts = std::make_shared<taskengine::artifacts::DiskArtifactStore>(root);
  auto sweeper   = h.MakeSweeper(SweepThresholds{}, artifacts);

  const auto expired  = h.Store(TaskStatus::kCompleted, kNowMs - 30 * kHourMs, kNowMs - 25 * kHourMs);
  const auto retained = h.Store(TaskStatus::kFailed, kNowMs - 30 * kHourMs, kNowMs - kHourMs);
  std::ofstream(artifacts->ArtifactPath(expired.id)) << "output";
  std::ofstream(artifacts->ArtifactPath(retained.id)) << "output";

  const auto report = sweeper->SweepOnce(kNowMs);
  assert(report.deleted == 1);
  assert(report.artifacts_released == 1);

  assert(!h.Load(expired.id));
  assert(!std::filesystem::exists(artifacts->ArtifactPath(expired.id)));
  assert(h.Load(retained.id));
  assert(std::filesystem::exists(artifacts->ArtifactPath(retained.id)));
}

void TestArtifactFailureDoesNotRestoreRow() {
  Harness h;
  auto    sweeper = h.MakeSweeper(SweepThresholds{}, std::make_shared<ThrowingArtifactStore>());

  const auto expired = h.Store(TaskStatus::kCancelled, kNowMs - 30 * kHourMs, kNowMs - 25 * kHourMs);

  const auto report = sweeper->SweepOnce(kNowMs);
  assert(report.deleted == 1);
  assert(report.artifacts_released == 0);
  assert(report.errors == 1);
  assert(!h.Load(expired.id));
}

void TestAbandonedRunningTasksFail() {
  Harness         h;
  SweepThresholds thresholds;
  thresholds.abandoned_max_age = std::chrono::milliseconds(2 * kHourMs);
  auto sweeper                 = h.MakeSweeper(thresholds);

  const auto abandoned = h.Store(TaskStatus::kRunning, kNowMs - 5 * kHourMs, kNowMs - 3 * kHourMs);
  const auto owned     = h.Store(TaskStatus::kRunning, kNowMs - 5 * kHourMs, kNowMs - 3 * kHourMs);
  const auto active    = h.Store(TaskStatus::kRunning, kNowMs - 5 * kHourMs, kNowMs - kHourMs);

  auto       owned_record = *h.Load(owned.id);
  const bool added        = h.registry->Add(
      std::make_shared<taskengine::registry::TaskHandle>(owned_record, std::make_shared<taskengine::cancellation::CancellationSignal>()));
  assert(added);

  const auto report = sweeper->SweepOnce(kNowMs);
  assert(report.failed == 1);
  assert(report.deleted == 0);

  const auto failed = h.Load(abandoned.id);
  assert(failed->status == TaskStatus::kFailed);
  assert(failed->error_message == "abandoned");
  assert(failed->version == abandoned.version + 1);

  assert(h.Load(owned.id)->status == TaskStatus::kRunning);
  assert(h.Load(active.id)->status == TaskStatus::kRunning);
}

void TestKindFilterLimitsRule() {
  Harness h;

  taskengine::sweeper::SweepRule rule;
  rule.name      = "other-kind";
  rule.statuses  = {TaskStatus::kCreated};
  rule.age_field = taskengine::db::AgeField::kCreatedAt;
  rule.max_age   = std::chrono::milliseconds(kHourMs);
  rule.kind      = "other";

  StalenessSweeper sweeper(h.repository, h.registry, h.cancellation, h.tombstones, {rule}, 1h);

  const auto counted = h.Store(TaskStatus::kCreated, kNowMs - 2 * kHourMs, kNowMs - 2 * kHourMs);
  const auto other   = h.Store(TaskStatus::kCreated, kNowMs - 2 * kHourMs, kNowMs - 2 * kHourMs, "other");

  const auto report = sweeper.SweepOnce(kNowMs);
  assert(report.deleted == 1);
  assert(h.Load(counted.id));
  assert(!h.Load(other.id));
}

void TestStartStopIsClean() {
  Harness h;
  auto    sweeper = std::make_unique<StalenessSweeper>(h.repository, h.registry, h.cancellation, h.tombstones,
                                                    StalenessSweeper::DefaultRules(SweepThresholds{}, nullptr), std::chrono::milliseconds(1));
  sweeper->Start();
  sweeper->Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  sweeper->Stop();
  sweeper->Stop();
}

} // namespace

int main() {
  TestUnstartedTasksExpireByCreationTime();
  TestQueuedTasksAreNotSwept();
  TestRecoveredTasksAreNotSweptAsUnstarted();
  TestTombstoneIsRecordedBeforeDelete();
  TestRunningTasksAreKeptWithoutAbandonedRule();
  TestTerminalRetentionReleasesArtifacts();
  TestArtifactFailureDoesNotRestoreRow();
  TestAbandonedRunningTasksFail();
  TestKindFilterLimitsRule();
  TestStartStopIsClean();

  std::cout << "task_engine_unit_staleness_sweeper: pass\n";
  return 0;
}
