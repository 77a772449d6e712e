#pragma once

#include "internal/model/task_status.hpp"
#include "internal/service/service_context.hpp"
#include "taskengine/v1.hpp"

namespace taskengine::service {

/*
  Proto-facing task operations.

  Converts between wire messages and core types, and records a span,
  request metrics and an error log per call. Errors propagate as the
  core's exceptions; the gRPC layer maps them to status codes.
*/
class TaskService {
 public:
  explicit TaskService(ServiceContext ctx);

  taskengine::v1::SubmitResponse Submit(const taskengine::v1::SubmitRequest& req);
  taskengine::v1::TaskProgress   GetProgress(const taskengine::v1::GetProgressRequest& req);
  taskengine::v1::CancelResponse Cancel(const taskengine::v1::CancelRequest& req);
  taskengine::v1::StatsResponse  Stats(const taskengine::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

// Wire enum for a core status.
taskengine::v1::TaskStatus ToProto(taskengine::model::TaskStatus status);

} // namespace taskengine::service
