#include "internal/sweeper/staleness_sweeper.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace taskengine::sweeper {

using taskengine::model::TaskStatus;
using taskengine::observability::StringField;
using taskengine::observability::UintField;

namespace {

uint64_t AgeOf(const db::model::TaskRecord& record, db::AgeField field) {
  return field == db::AgeField::kCreatedAt ? record.created_at_ms : record.updated_at_ms;
}

// Rows are inserted at version 1 and a CREATED row is only rewritten by
// recovery, which moves a claimed task back.
bool WasClaimed(const db::model::TaskRecord& record) {
  return record.version > 1 || record.current != record.x;
}

} // namespace

StalenessSweeper::StalenessSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::TaskRegistry> registry,
                                   std::shared_ptr<cancellation::CancellationCoordinator> cancellation, std::shared_ptr<TombstoneLog> tombstones,
                                   std::vector<SweepRule> rules, std::chrono::milliseconds period)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      cancellation_(std::move(cancellation)),
      tombstones_(std::move(tombstones)),
      rules_(std::move(rules)),
      period_(period) {
}

StalenessSweeper::~StalenessSweeper() {
  Stop();
}

std::vector<SweepRule> StalenessSweeper::DefaultRules(const SweepThresholds& thresholds, artifacts::ArtifactStorePtr artifacts) {
  std::vector<SweepRule> rules;

  rules.push_back(SweepRule{
      .name         = "unstarted",
      .statuses     = {TaskStatus::kCreated},
      .age_field    = db::AgeField::kCreatedAt,
      .max_age      = thresholds.created_max_age,
      .action       = SweepAction::kDelete,
      .skip_claimed = true,
  });

  rules.push_back(SweepRule{
      .name      = "retention",
      .statuses  = {TaskStatus::kCompleted, TaskStatus::kCancelled, TaskStatus::kFailed},
      .age_field = db::AgeField::kUpdatedAt,
      .max_age   = thresholds.terminal_retention,
      .action    = SweepAction::kDelete,
      .artifacts = std::move(artifacts),
  });

  if (thresholds.abandoned_max_age.count() > 0) {
    rules.push_back(SweepRule{
        .name            = "abandoned",
        .statuses        = {TaskStatus::kRunning},
        .age_field       = db::AgeField::kUpdatedAt,
        .max_age         = thresholds.abandoned_max_age,
        .action          = SweepAction::kFail,
        .failure_message = "abandoned",
    });
  }

  return rules;
}

void StalenessSweeper::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;

  stopping_ = false;
  thread_   = std::thread(&StalenessSweeper::Run, this);
  TASKENGINE_LOG_INFO("Staleness sweeper started", {UintField("period_ms", static_cast<uint64_t>(period_.count())), UintField("rules", rules_.size())});
}

void StalenessSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
    TASKENGINE_LOG_INFO("Staleness sweeper stopped");
  }
}

void StalenessSweeper::Run() {
  std::unique_lock lock(mutex_);

  while (!cv_.wait_for(lock, period_, [&] { return stopping_; })) {
    lock.unlock();
    SweepOnce(util::NowMillis());
    lock.lock();
  }
}

SweepReport StalenessSweeper::SweepOnce(uint64_t now_ms) {
  observability::SpanScope span("sweeper.sweep");

  SweepReport report;
  for (const auto& rule : rules_) {
    try {
      ApplyRule(rule, now_ms, report);
    } catch (const std::exception& e) {
      ++report.errors;
      span.RecordException(e.what());
      TASKENGINE_LOG_ERROR("Sweep rule failed", {StringField("rule", rule.name), StringField("error", e.what())});
    }
  }

  span.SetAttribute("sweep.deleted", static_cast<std::int64_t>(report.deleted));
  span.SetAttribute("sweep.failed", static_cast<std::int64_t>(report.failed));

  if (report.deleted > 0 || report.failed > 0 || report.errors > 0) {
    TASKENGINE_LOG_INFO("Sweep finished", {UintField("examined", report.examined), UintField("deleted", report.deleted),
                                           UintField("failed", report.failed), UintField("artifacts_released", report.artifacts_released),
                                           UintField("errors", report.errors)});
  }
  return report;
}

void StalenessSweeper::ApplyRule(const SweepRule& rule, uint64_t now_ms, SweepReport& report) {
  const auto cutoff_ms = util::CutoffMillis(now_ms, static_cast<uint64_t>(rule.max_age.count()));

  for (const auto status : rule.statuses) {
    std::vector<db::model::TaskRecord> candidates;
    {
      auto tx    = repository_->Begin();
      candidates = repository_->FindByStatusOlderThan(*tx, status, rule.age_field, cutoff_ms);
      tx->Commit();
    }

    for (const auto& candidate : candidates) {
      if (rule.kind && candidate.kind != *rule.kind) continue;
      ++report.examined;

      if (IsOwned(candidate.id)) continue;
      if (rule.skip_claimed && WasClaimed(candidate)) continue;

      if (!SweepCandidate(rule, candidate, cutoff_ms)) continue;

      if (rule.action == SweepAction::kFail) {
        ++report.failed;
        observability::Metrics::Instance().RecordTaskTransition(ToString(TaskStatus::kFailed));
        TASKENGINE_LOG_INFO("Swept task failed", {StringField("rule", rule.name), StringField("task_id", candidate.id)});
        continue;
      }

      ++report.deleted;
      TASKENGINE_LOG_INFO("Swept task deleted", {StringField("rule", rule.name), StringField("task_id", candidate.id),
                                                 StringField("status", ToString(candidate.status))});

      if (!rule.artifacts) continue;
      try {
        rule.artifacts->ReleaseArtifacts(candidate.id);
        ++report.artifacts_released;
      } catch (const std::exception& e) {
        ++report.errors;
        TASKENGINE_LOG_ERROR("Artifact release failed", {StringField("task_id", candidate.id), StringField("error", e.what())});
      }
    }
  }
}

bool StalenessSweeper::IsOwned(const std::string& task_id) const {
  return (registry_ && registry_->Find(task_id)) || (cancellation_ && cancellation_->Contains(task_id));
}

/*
  Re-reads the candidate and applies the rule only if it still matches.
  Returns true when the row was deleted or failed.
*/
bool StalenessSweeper::SweepCandidate(const SweepRule& rule, const db::model::TaskRecord& candidate, uint64_t cutoff_ms) {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetTask(*tx, candidate.id);
  if (!stored || stored->status != candidate.status || AgeOf(*stored, rule.age_field) >= cutoff_ms ||
      (rule.skip_claimed && WasClaimed(*stored))) {
    tx->Rollback();
    return false;
  }

  if (rule.action == SweepAction::kDelete) {
    // A cancel that misses the row must already find the tombstone.
    if (tombstones_) {
      tombstones_->Add(stored->id);
    }
    auto result = repository_->DeleteTask(*tx, stored->id);
    if (!result) {
      tx->Rollback();
      throw std::runtime_error("delete task " + stored->id + " failed: " + result.message);
    }
    tx->Commit();
    observability::Metrics::Instance().RecordStoreWrite("sweep_delete");
    return true;
  }

  auto next          = *stored;
  next.status        = TaskStatus::kFailed;
  next.error_message = rule.failure_message;
  next.updated_at_ms = util::NowMillis();
  next.version       = stored->version + 1;

  auto result = repository_->CompareAndSwapTask(*tx, next, stored->version);
  if (result.IsConflict() || result.code == db::ErrorCode::NotFound) {
    tx->Rollback();
    TASKENGINE_LOG_WARN("Sweep lost race", {StringField("rule", rule.name), StringField("task_id", stored->id)});
    return false;
  }
  if (!result) {
    tx->Rollback();
    throw std::runtime_error("fail task " + stored->id + " failed: " + result.message);
  }
  tx->Commit();
  observability::Metrics::Instance().RecordStoreWrite("sweep_fail");
  return true;
}

} // namespace taskengine::sweeper
