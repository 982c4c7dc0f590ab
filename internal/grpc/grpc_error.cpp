#include "grpc_error.hpp"

#include "internal/publish/publish_error.hpp"
#include "internal/util/errors.hpp"

namespace keyserver::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace keyserver::util;

  if (dynamic_cast<const publish::PublishError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidConfig*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

std::string ErrorCode(const std::exception& e) {
  using namespace keyserver::util;

  if (const auto* publish_error = dynamic_cast<const publish::PublishError*>(&e)) {
    return std::string(publish::PublishErrorCode(publish_error->kind()));
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return "invalid_request";
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return "unknown_app";
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return "permission_denied";
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return "duplicate_key";
  }
  if (dynamic_cast<const InvalidConfig*>(&e)) {
    return "invalid_config";
  }
  return "internal";
}

} // namespace keyserver::grpc
