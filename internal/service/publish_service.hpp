#pragma once

#include <string>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/model/exposure.hpp"
#include "internal/util/time.hpp"
#include "keyserver/v1.hpp"
#include "service_context.hpp"

namespace keyserver::service {

struct PublishOutcome {
  keyserver::v1::PublishResponse response;

  // Nonce the device attestation must have been requested with.
  std::string attestation_nonce;

  // Stored records, in request order.
  std::vector<keyserver::model::Exposure> exposures;
};

/*
  Publish pipeline:

    request -> authorize app/regions -> attestation nonce
            -> transform + validate batch -> insert in one transaction

  Verifying the attestation payload against the nonce belongs to the
  transport layer; the nonce is returned for that purpose.

  Throws on any failure; nothing is stored in that case. Use
  grpc::ToStatus / grpc::ErrorCode to report the exception.
*/
class PublishService {
public:
  explicit PublishService(ServiceContext ctx);

  PublishOutcome Publish(const keyserver::v1::PublishRequest& req, util::TimePoint batch_time);

  std::vector<keyserver::model::Exposure> ListExposures(const db::ExposureQuery& query);

private:
  ServiceContext ctx_;
};

}
