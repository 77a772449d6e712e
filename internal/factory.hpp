#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/task_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/executor/task_executor.hpp"
#include "internal/sweeper/staleness_sweeper.hpp"

namespace taskengine::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                        repository;
  std::shared_ptr<cancellation::CancellationCoordinator> cancellation;
  std::shared_ptr<registry::TaskRegistry>                registry;
  std::shared_ptr<sweeper::TombstoneLog>                 tombstones;
  std::shared_ptr<executor::TaskExecutor>                executor;
  std::shared_ptr<sweeper::StalenessSweeper>             sweeper;
  std::shared_ptr<core::TaskManager>                     manager;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Sweeper first, then the executor: running tasks are flushed and left
  // RUNNING for the next Recover().
  void Stop();
};

// Config values with zero/absent fields replaced by defaults.
executor::ExecutorOptions ResolveExecutorOptions(const taskengine::runtime::config::RuntimeConfig& config);
core::ManagerOptions      ResolveManagerOptions(const taskengine::runtime::config::RuntimeConfig& config);
sweeper::SweepThresholds  ResolveSweepThresholds(const taskengine::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const taskengine::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: wires store, executor, sweeper and services, starts
  the background threads and recovers tasks left by a previous process.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const taskengine::runtime::config::RuntimeConfig& config);

} // namespace taskengine::factory
