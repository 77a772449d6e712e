#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/artifacts/artifact_store.hpp"
#include "internal/cancellation/cancellation_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/sweeper/tombstone_log.hpp"

namespace taskengine::sweeper {

enum class SweepAction {
  kDelete,
  kFail,
};

/*
  One cleanup criterion.

  Matches tasks in any of `statuses` whose age_field is older than
  max_age, optionally restricted to one task kind. kDelete removes the row
  and then releases artifacts; kFail swaps it to FAILED with
  failure_message. skip_claimed leaves alone rows a worker has claimed at
  some point, such as orphans recovery put back to CREATED. Rules are data, so a second task kind reuses the
  mechanism with its own thresholds and artifact store.
*/
struct SweepRule {
  std::string                                name;
  std::vector<taskengine::model::TaskStatus> statuses;
  db::AgeField                               age_field = db::AgeField::kCreatedAt;
  std::chrono::milliseconds                  max_age{0};
  std::optional<std::string>                 kind;
  SweepAction                                action = SweepAction::kDelete;
  artifacts::ArtifactStorePtr                artifacts;
  std::string                                failure_message = "abandoned";
  bool                                       skip_claimed    = false;
};

struct SweepThresholds {
  std::chrono::milliseconds created_max_age{std::chrono::hours(1)};
  std::chrono::milliseconds terminal_retention{std::chrono::hours(24)};
  // zero disables the abandoned rule
  std::chrono::milliseconds abandoned_max_age{0};
};

struct SweepReport {
  uint64_t examined           = 0;
  uint64_t deleted            = 0;
  uint64_t failed             = 0;
  uint64_t artifacts_released = 0;
  uint64_t errors             = 0;
};

/*
  Periodic staleness cleanup.

  Candidates come from an age query; each one is re-read and re-checked
  in its own transaction before it is touched, so a concurrent claim,
  flush or cancel that refreshed the row wins. Tasks resident in the
  registry or waiting in the execution queue are never swept. A deleted
  id is tombstoned before its row goes away.
*/
class StalenessSweeper {
 public:
  StalenessSweeper(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::TaskRegistry> registry,
                   std::shared_ptr<cancellation::CancellationCoordinator> cancellation, std::shared_ptr<TombstoneLog> tombstones,
                   std::vector<SweepRule> rules, std::chrono::milliseconds period);
  ~StalenessSweeper();

  StalenessSweeper(const StalenessSweeper&)            = delete;
  StalenessSweeper& operator=(const StalenessSweeper&) = delete;

  static std::vector<SweepRule> DefaultRules(const SweepThresholds& thresholds, artifacts::ArtifactStorePtr artifacts);

  void Start();
  void Stop();

  SweepReport SweepOnce(uint64_t now_ms);

  const std::vector<SweepRule>& Rules() const {
    return rules_;
  }

 private:
  void Run();
  void ApplyRule(const SweepRule& rule, uint64_t now_ms, SweepReport& report);
  bool SweepCandidate(const SweepRule& rule, const db::model::TaskRecord& candidate, uint64_t cutoff_ms);

  bool IsOwned(const std::string& task_id) const;

  std::shared_ptr<db::Repository>                        repository_;
  std::shared_ptr<registry::TaskRegistry>                registry_;
  std::shared_ptr<cancellation::CancellationCoordinator> cancellation_;
  std::shared_ptr<TombstoneLog>                          tombstones_;
  std::vector<SweepRule>                                 rules_;
  std::chrono::milliseconds                              period_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace taskengine::sweeper
