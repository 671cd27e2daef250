#include "grpc_error.hpp"

#include <stdexcept>
#include <string>

namespace weave::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace weave::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ConcurrencyConflict*>(&e) || dynamic_cast<const WorkerLeaseExpired*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  // NondeterminismDetected and anything unexpected
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status, const std::string& action) {
  if (status.ok()) {
    return;
  }

  using namespace weave::util;
  const std::string message = action + " failed: " + status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      throw NotFound(message);
    case ::grpc::StatusCode::ALREADY_EXISTS:
      throw AlreadyExists(message);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      throw InvalidArgument(message);
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      throw InvalidState(message);
    case ::grpc::StatusCode::ABORTED:
      throw ConcurrencyConflict(message);
    case ::grpc::StatusCode::UNAVAILABLE:
      throw StoreUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace weave::grpc
