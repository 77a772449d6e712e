#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/task_service.hpp"
#include "taskengine/v1.hpp"

namespace taskengine::grpc {

class TaskServer final : public taskengine::v1::TaskService::Service {
 public:
  explicit TaskServer(std::shared_ptr<taskengine::service::TaskService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*, const taskengine::v1::SubmitRequest*, taskengine::v1::SubmitResponse*) override;

  ::grpc::Status GetProgress(::grpc::ServerContext*, const taskengine::v1::GetProgressRequest*, taskengine::v1::TaskProgress*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*, const taskengine::v1::CancelRequest*, taskengine::v1::CancelResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const taskengine::v1::StatsRequest*, taskengine::v1::StatsResponse*) override;

 private:
  std::shared_ptr<taskengine::service::TaskService> service_;
};

} // namespace taskengine::grpc
