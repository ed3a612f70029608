#include "grpc_error.hpp"

namespace settlement::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace settlement::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (const auto* validation = dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what(), validation->reason()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Transient*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  if (dynamic_cast<const Unauthenticated*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace settlement::grpc
