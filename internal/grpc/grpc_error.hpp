#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace weave::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/
::grpc::Status ToStatus(const std::exception& e);

/*
  Client side inverse: throws the util exception matching a non-OK
  status. `action` prefixes the message.
*/
void ThrowIfError(const ::grpc::Status& status, const std::string& action);

} // namespace weave::grpc
