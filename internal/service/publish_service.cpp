#include "publish_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/authorizedapp/authorized_app_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/model/publish_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/publish/canonical.hpp"
#include "internal/publish/transformer.hpp"
#include "internal/util/errors.hpp"

namespace keyserver::service {

using keyserver::observability::DurationField;
using keyserver::observability::IntField;
using keyserver::observability::StringField;

namespace {

void ThrowOnInsertFailure(const db::Result& result) {
  if (result) {
    return;
  }
  if (result.IsDuplicate()) {
    throw util::AlreadyExists("exposure key already published: " + result.message);
  }
  throw std::runtime_error("failed to store exposures (" + std::string(db::ErrorCodeName(result.code)) + "): " + result.message);
}

} // namespace

PublishService::PublishService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PublishOutcome PublishService::Publish(const keyserver::v1::PublishRequest& req, util::TimePoint batch_time) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto submission = keyserver::model::FromProto(req);

  try {
    ctx_.registry->Authorize(submission);

    PublishOutcome outcome;
    outcome.attestation_nonce = publish::AttestationNonce(submission);
    KEYSERVER_LOG_DEBUG("attestation nonce", {StringField("app", submission.app_package_name),
                                              StringField("nonce", outcome.attestation_nonce)});
    outcome.exposures = ctx_.transformer->TransformPublish(submission, batch_time);

    std::vector<db::model::ExposureRecord> records;
    records.reserve(outcome.exposures.size());
    for (const auto& exposure : outcome.exposures) {
      records.push_back(db::model::ToRecord(exposure));
    }

    auto tx = ctx_.repository->Begin();
    ThrowOnInsertFailure(ctx_.repository->InsertExposures(*tx, records));
    tx->Commit();

    outcome.response.set_inserted_exposures(static_cast<std::int32_t>(records.size()));

    KEYSERVER_LOG_INFO("publish accepted", {StringField("app", submission.app_package_name),
                                            IntField("inserted_exposures", static_cast<std::int64_t>(records.size())),
                                            DurationField("latency", std::chrono::steady_clock::now() - started_at)});
    return outcome;
  } catch (const std::exception& ex) {
    KEYSERVER_LOG_WARN("publish rejected", {StringField("app", submission.app_package_name),
                                            IntField("keys", static_cast<std::int64_t>(submission.keys.size())),
                                            StringField("code", keyserver::grpc::ErrorCode(ex)), StringField("error", ex.what()),
                                            DurationField("latency", std::chrono::steady_clock::now() - started_at)});
    throw;
  }
}

std::vector<keyserver::model::Exposure> PublishService::ListExposures(const db::ExposureQuery& query) {
  auto tx      = ctx_.repository->Begin();
  auto records = ctx_.repository->ListExposures(*tx, query);
  // read only
  tx->Rollback();

  std::vector<keyserver::model::Exposure> exposures;
  exposures.reserve(records.size());
  for (const auto& record : records) {
    exposures.push_back(db::model::FromRecord(record));
  }
  return exposures;
}

} // namespace keyserver::service
