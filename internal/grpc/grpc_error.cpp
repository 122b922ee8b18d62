#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace localdeck::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace localdeck::util;

  if (dynamic_cast<const UnknownCard*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const UnsupportedSource*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, std::string("unsupported source: ") + e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const SourceUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, std::string("content missing: ") + e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Cancelled*>(&e)) {
    return {::grpc::StatusCode::CANCELLED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace localdeck::grpc
