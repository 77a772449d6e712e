#include "internal/grpc/grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace taskengine::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace taskengine::util;

  if (dynamic_cast<const InvalidRange*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace taskengine::grpc
