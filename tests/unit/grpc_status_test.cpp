#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/task_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/task_server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/task_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "taskengine/v1.hpp"

namespace {

using namespace taskengine::v1;

struct Stack {
  explicit Stack(std::size_t queue_capacity = 8) {
    taskengine::executor::ExecutorOptions options;
    options.worker_count   = 1;
    options.queue_capacity = queue_capacity;

    repository   = std::make_shared<taskengine::db::memory::MemoryRepository>();
    cancellation = std::make_shared<taskengine::cancellation::CancellationCoordinator>();
    registry     = std::make_shared<taskengine::registry::TaskRegistry>(options.worker_count);
    tombstones   = std::make_shared<taskengine::sweeper::TombstoneLog>(8);
    // never started: submitted tasks stay queued and CREATED
    executor = std::make_shared<taskengine::executor::TaskExecutor>(repository, cancellation, registry, options);

    taskengine::service::ServiceContext ctx;
    ctx.manager = std::make_shared<taskengine::core::TaskManager>(repository, cancellation, registry, executor, tombstones,
                                                                  taskengine::core::ManagerOptions{});
    server      = std::make_unique<taskengine::grpc::TaskServer>(std::make_shared<taskengine::service::TaskService>(ctx));
  }

  ::grpc::Status Submit(int64_t x, int64_t y, SubmitResponse* resp) {
    SubmitRequest req;
    req.set_x(x);
    req.set_y(y);
    ::grpc::ServerContext grpc_ctx;
    return server->Submit(&grpc_ctx, &req, resp);
  }

  ::grpc::Status GetProgress(const std::string& id, taskengine::v1::TaskProgress* resp) {
    GetProgressRequest req;
    req.mutable_id()->set_value(id);
    ::grpc::ServerContext grpc_ctx;
    return server->GetProgress(&grpc_ctx, &req, resp);
  }

  ::grpc::Status Cancel(const std::string& id, CancelResponse* resp) {
    CancelRequest req;
    req.mutable_id()->set_value(id);
    ::grpc::ServerContext grpc_ctx;
    return server->Cancel(&grpc_ctx, &req, resp);
  }

  std::shared_ptr<taskengine::db::memory::MemoryRepository>          repository;
  std::shared_ptr<taskengine::cancellation::CancellationCoordinator> cancellation;
  std::shared_ptr<taskengine::registry::TaskRegistry>                registry;
  std::shared_ptr<taskengine::sweeper::TombstoneLog>                 tombstones;
  std::shared_ptr<taskengine::executor::TaskExecutor>                executor;
  std::unique_ptr<taskengine::grpc::TaskServer>                      server;
};

void TestInvalidRangeReturnsInvalidArgument() {
  Stack          stack;
  SubmitResponse resp;

  const auto status = stack.Submit(10, 1, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(resp.id().value().empty());
}

void TestSubmitReturnsQueryableTask() {
  Stack          stack;
  SubmitResponse submitted;
  assert(stack.Submit(-2, 2, &submitted).ok());
  assert(taskengine::util::IsCanonicalUUID(submitted.id().value()));

  taskengine::v1::TaskProgress progress;
  assert(stack.GetProgress(submitted.id().value(), &progress).ok());
  assert(progress.id().value() == submitted.id().value());
  assert(progress.x() == -2);
  assert(progress.y() == 2);
  assert(progress.current() == -2);
  assert(progress.status() == TASK_STATUS_CREATED);
  assert(progress.percentage() == 0.0);
}

void TestUnknownOrEmptyIdReturnsNotFound() {
  Stack                        stack;
  taskengine::v1::TaskProgress progress;
  CancelResponse               cancel;

  assert(stack.GetProgress(taskengine::util::GenerateUUIDString(), &progress).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(stack.GetProgress("", &progress).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(stack.Cancel(taskengine::util::GenerateUUIDString(), &cancel).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCancelOutcomes() {
  Stack          stack;
  SubmitResponse submitted;
  assert(stack.Submit(0, 100, &submitted).ok());

  CancelResponse cancel;
  assert(stack.Cancel(submitted.id().value(), &cancel).ok());
  assert(cancel.outcome() == CANCEL_OUTCOME_CANCELLED);

  taskengine::v1::TaskProgress progress;
  assert(stack.GetProgress(submitted.id().value(), &progress).ok());
  assert(progress.status() == TASK_STATUS_CANCELLED);

  const auto swept = taskengine::util::GenerateUUIDString();
  stack.tombstones->Add(swept);
  assert(stack.Cancel(swept, &cancel).ok());
  assert(cancel.outcome() == CANCEL_OUTCOME_ALREADY_DELETED);
}

void TestFullQueueReturnsResourceExhausted() {
  Stack          stack(1);
  SubmitResponse resp;

  assert(stack.Submit(0, 1, &resp).ok());
  assert(stack.Submit(0, 1, &resp).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);

  StatsRequest          req;
  StatsResponse         stats;
  ::grpc::ServerContext grpc_ctx;
  assert(stack.server->Stats(&grpc_ctx, &req, &stats).ok());
  assert(stats.tasks_created() == 1);
  assert(stats.queued() == 1);
  assert(stats.in_flight() == 0);
}

void TestExceptionMapping() {
  using taskengine::grpc::ToStatus;

  assert(ToStatus(taskengine::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(taskengine::util::ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(std::runtime_error("disk on fire")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("disk on fire")).error_message() == "disk on fire");
}

} // namespace

int main() {
  TestInvalidRangeReturnsInvalidArgument();
  TestSubmitReturnsQueryableTask();
  TestUnknownOrEmptyIdReturnsNotFound();
  TestCancelOutcomes();
  TestFullQueueReturnsResourceExhausted();
  TestExceptionMapping();

  std::cout << "task_engine_unit_grpc_status: pass\n";
  return 0;
}
