#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>
#include <string>

namespace keyserver::grpc {

/*
  Converts internal exceptions into gRPC status codes and into the stable
  error code string reported in PublishResponse.code.
*/

::grpc::Status ToStatus(const std::exception& e);

std::string ErrorCode(const std::exception& e);

} // namespace keyserver::grpc
