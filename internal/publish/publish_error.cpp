#include "internal/publish/publish_error.hpp"

#include <utility>

namespace keyserver::publish {

std::string_view PublishErrorCode(PublishErrorKind kind) {
  switch (kind) {
    case PublishErrorKind::kInvalidKeyEncoding:
      return "invalid_key_encoding";
    case PublishErrorKind::kInvalidKeyLength:
      return "invalid_key_length";
    case PublishErrorKind::kInvalidIntervalCount:
      return "invalid_interval_count";
    case PublishErrorKind::kIntervalTooOld:
      return "interval_too_old";
    case PublishErrorKind::kIntervalInFuture:
      return "interval_in_future";
    case PublishErrorKind::kKeyStillValid:
      return "key_still_valid";
    case PublishErrorKind::kInvalidTransmissionRisk:
      return "invalid_transmission_risk";
    case PublishErrorKind::kEmptyKeySet:
      return "empty_key_set";
    case PublishErrorKind::kTooManyKeys:
      return "too_many_keys";
    case PublishErrorKind::kInvalidPublishData:
      return "invalid_publish_data";
    case PublishErrorKind::kMisalignedOverlap:
      return "misaligned_overlap";
  }
  return "unknown";
}

PublishError::PublishError(PublishErrorKind kind, const std::string& msg, PublishErrorContext context)
    : std::runtime_error(msg), kind_(kind), context_(std::move(context)) {
}

PublishError PublishError::InvalidPublishData(const PublishError& cause) {
  PublishError wrapped(PublishErrorKind::kInvalidPublishData, "invalid publish data: " + std::string(cause.what()), cause.context());
  wrapped.cause_ = cause.kind();
  return wrapped;
}

} // namespace keyserver::publish
