#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace taskengine::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace taskengine::grpc
