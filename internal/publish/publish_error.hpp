#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace keyserver::publish {

/*
  Every way the publish pipeline can reject input.

  The set is closed: transport layers switch on the kind and never parse the
  message text.
*/
enum class PublishErrorKind {
  kInvalidKeyEncoding,
  kInvalidKeyLength,
  kInvalidIntervalCount,
  kIntervalTooOld,
  kIntervalInFuture,
  kKeyStillValid,
  kInvalidTransmissionRisk,
  kEmptyKeySet,
  kTooManyKeys,
  kInvalidPublishData,
  kMisalignedOverlap,
};

// Stable identifier, e.g. "interval_too_old".
std::string_view PublishErrorCode(PublishErrorKind kind);

/*
  The numbers behind a rejection.

  value is the offending input, the bounds are the limits it was checked
  against. Unused bounds stay empty.

    kInvalidKeyLength        value=decoded length   lower=upper=16
    kInvalidIntervalCount    value=count            lower=1 upper=144
    kIntervalTooOld          value=interval number  lower=min interval
    kIntervalInFuture        value=interval number  upper=max interval (exclusive)
    kKeyStillValid           value=interval end     upper=max interval
    kInvalidTransmissionRisk value=risk             lower=0 upper=8
    kTooManyKeys             value=key count        upper=configured maximum
    kMisalignedOverlap       value=interval number  lower=previous start upper=previous end
*/
struct PublishErrorContext {
  std::int64_t                value = 0;
  std::optional<std::int64_t> lower_bound;
  std::optional<std::int64_t> upper_bound;
};

class PublishError : public std::runtime_error {
 public:
  PublishError(PublishErrorKind kind, const std::string& msg, PublishErrorContext context = {});

  // Wraps a per-key failure into a batch level kInvalidPublishData error.
  // The cause kind and its context are kept.
  static PublishError InvalidPublishData(const PublishError& cause);

  PublishErrorKind kind() const {
    return kind_;
  }

  const PublishErrorContext& context() const {
    return context_;
  }

  // Set only for kInvalidPublishData.
  std::optional<PublishErrorKind> cause() const {
    return cause_;
  }

 private:
  PublishErrorKind                kind_;
  PublishErrorContext             context_;
  std::optional<PublishErrorKind> cause_;
};

} // namespace keyserver::publish
