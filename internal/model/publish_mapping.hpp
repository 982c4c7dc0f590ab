#pragma once

#include <string>
#include <string_view>

#include "internal/model/publish.hpp"
#include "keyserver/v1.hpp"

namespace keyserver::model {

/*
  Wire <-> model mapping for the publish API.

  The JSON field names live in publish.proto (keyserver.publish.v1); this is
  the only place that knows how they line up with the model. Adding a wire
  version means adding a mapping here, not touching the model.
*/

// Throws util::InvalidArgument on malformed JSON or unknown fields.
keyserver::v1::PublishRequest ParsePublishRequestJson(std::string_view json);

std::string ToJson(const keyserver::v1::PublishResponse& response);

Publish FromProto(const keyserver::v1::PublishRequest& request);

keyserver::v1::PublishRequest ToProto(const Publish& publish);

} // namespace keyserver::model
