#include "internal/service/task_service.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/core/task_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace taskengine::service {

using namespace taskengine::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const TaskID* task_id, Fn&& fn) {
  taskengine::observability::SpanScope span(route);
  if (task_id) {
    span.SetAttribute("task.id", task_id->value());
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    taskengine::observability::Metrics::Instance().RecordRequest(route, true);
    taskengine::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TASKENGINE_LOG_ERROR("RPC failed", {taskengine::observability::StringField("route", route),
                                        taskengine::observability::StringField("error", ex.what()),
                                        taskengine::observability::StringField("task_id", task_id ? task_id->value() : "")});
    taskengine::observability::Metrics::Instance().RecordRequest(route, false);
    taskengine::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

const std::string& RequireId(const TaskID& id) {
  if (id.value().empty()) {
    throw taskengine::util::NotFound("task id is required");
  }
  return id.value();
}

TaskProgress ToProto(const taskengine::core::TaskProgress& progress) {
  TaskProgress out;
  out.mutable_id()->set_value(progress.id);
  out.set_x(progress.x);
  out.set_y(progress.y);
  out.set_current(progress.current);
  out.set_status(taskengine::service::ToProto(progress.status));
  out.set_percentage(progress.percentage);
  out.set_error_message(progress.error_message);
  return out;
}

CancelOutcome ToProto(taskengine::core::CancelOutcome outcome) {
  switch (outcome) {
    case taskengine::core::CancelOutcome::kSignalled:
      return CANCEL_OUTCOME_SIGNALLED;
    case taskengine::core::CancelOutcome::kCancelled:
      return CANCEL_OUTCOME_CANCELLED;
    case taskengine::core::CancelOutcome::kAlreadyTerminal:
      return CANCEL_OUTCOME_ALREADY_TERMINAL;
    case taskengine::core::CancelOutcome::kAlreadyDeleted:
      return CANCEL_OUTCOME_ALREADY_DELETED;
  }
  return CANCEL_OUTCOME_UNSPECIFIED;
}

} // namespace

taskengine::v1::TaskStatus ToProto(taskengine::model::TaskStatus status) {
  switch (status) {
    case taskengine::model::TaskStatus::kCreated:
      return TASK_STATUS_CREATED;
    case taskengine::model::TaskStatus::kRunning:
      return TASK_STATUS_RUNNING;
    case taskengine::model::TaskStatus::kCompleted:
      return TASK_STATUS_COMPLETED;
    case taskengine::model::TaskStatus::kCancelled:
      return TASK_STATUS_CANCELLED;
    case taskengine::model::TaskStatus::kFailed:
      return TASK_STATUS_FAILED;
  }
  return TASK_STATUS_UNSPECIFIED;
}

TaskService::TaskService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitResponse TaskService::Submit(const SubmitRequest& req) {
  return ObserveRpc("TaskService.Submit", nullptr, [&] {
    SubmitResponse resp;
    resp.mutable_id()->set_value(ctx_.manager->Submit(req.x(), req.y()));
    return resp;
  });
}

TaskProgress TaskService::GetProgress(const GetProgressRequest& req) {
  return ObserveRpc("TaskService.GetProgress", &req.id(), [&] { return ToProto(ctx_.manager->GetProgress(RequireId(req.id()))); });
}

CancelResponse TaskService::Cancel(const CancelRequest& req) {
  return ObserveRpc("TaskService.Cancel", &req.id(), [&] {
    CancelResponse resp;
    resp.set_outcome(ToProto(ctx_.manager->Cancel(RequireId(req.id()))));
    return resp;
  });
}

StatsResponse TaskService::Stats(const StatsRequest&) {
  return ObserveRpc("TaskService.Stats", nullptr, [&] {
    const auto stats = ctx_.manager->Stats();

    StatsResponse resp;
    resp.set_tasks_created(stats.created);
    resp.set_tasks_running(stats.running);
    resp.set_tasks_completed(stats.completed);
    resp.set_tasks_cancelled(stats.cancelled);
    resp.set_tasks_failed(stats.failed);
    resp.set_in_flight(stats.in_flight);
    resp.set_queued(stats.queued);
    return resp;
  });
}

} // namespace taskengine::service
