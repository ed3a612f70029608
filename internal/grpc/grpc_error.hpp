#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace settlement::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    NotFound          NOT_FOUND
    AlreadyExists     ALREADY_EXISTS
    ValidationError   INVALID_ARGUMENT
    InvalidState      FAILED_PRECONDITION
    Transient         UNAVAILABLE
    DeadlineExceeded  DEADLINE_EXCEEDED
    Unauthenticated   UNAUTHENTICATED
    anything else     INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs fn and maps what it throws.
template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace settlement::grpc
