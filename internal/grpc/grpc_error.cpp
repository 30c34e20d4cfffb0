#include "internal/grpc/grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace fetchgate::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace fetchgate::util;

  if (dynamic_cast<const AgentNotConnected*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const AgentBusy*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const TransferNotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const ProtocolViolation*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace fetchgate::grpc
