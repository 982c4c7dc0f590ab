#include "internal/model/publish_mapping.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/model/region.hpp"
#include "internal/util/errors.hpp"

namespace keyserver::model {

using keyserver::v1::PublishRequest;
using keyserver::v1::PublishResponse;

PublishRequest ParsePublishRequestJson(std::string_view json) {
  PublishRequest request;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &request, options);
  if (!status.ok()) {
    throw util::InvalidArgument("unable to parse publish request: " + std::string(status.message()));
  }
  return request;
}

std::string ToJson(const PublishResponse& response) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = false;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(response, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize publish response: " + std::string(status.message()));
  }
  return json;
}

Publish FromProto(const PublishRequest& request) {
  Publish publish;

  publish.keys.reserve(request.temporary_exposure_keys_size());
  for (const auto& wire_key : request.temporary_exposure_keys()) {
    ExposureKey key;
    key.key               = wire_key.key();
    key.interval_number   = wire_key.rolling_start_number();
    key.interval_count    = wire_key.rolling_period();
    key.transmission_risk = wire_key.transmission_risk();
    publish.keys.push_back(std::move(key));
  }

  publish.regions.reserve(request.regions_size());
  for (const auto& region : request.regions()) {
    ValidateRegion(region);
    publish.regions.push_back(region);
  }
  publish.app_package_name            = request.app_package_name();
  publish.platform                    = request.platform();
  publish.device_verification_payload = request.device_verification_payload();
  publish.verification_payload        = request.verification_payload();
  publish.padding                     = request.padding();
  return publish;
}

PublishRequest ToProto(const Publish& publish) {
  PublishRequest request;

  for (const auto& key : publish.keys) {
    auto* wire_key = request.add_temporary_exposure_keys();
    wire_key->set_key(key.key);
    wire_key->set_rolling_start_number(key.interval_number);
    wire_key->set_rolling_period(key.interval_count);
    wire_key->set_transmission_risk(key.transmission_risk);
  }

  for (const auto& region : publish.regions) {
    request.add_regions(region);
  }
  request.set_app_package_name(publish.app_package_name);
  request.set_platform(publish.platform);
  request.set_device_verification_payload(publish.device_verification_payload);
  request.set_verification_payload(publish.verification_payload);
  request.set_padding(publish.padding);
  return request;
}

} // namespace keyserver::model
