#include "internal/grpc/task_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace taskengine::grpc {

using namespace taskengine::v1;

TaskServer::TaskServer(std::shared_ptr<taskengine::service::TaskService> svc) : service_(std::move(svc)) {
}

::grpc::Status TaskServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::GetProgress(::grpc::ServerContext*, const GetProgressRequest* req, TaskProgress* resp) {
  try {
    *resp = service_->GetProgress(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, CancelResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace taskengine::grpc
