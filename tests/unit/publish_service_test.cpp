#include "internal/service/publish_service.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/authorizedapp/authorized_app_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/model/interval.hpp"
#include "internal/model/publish_mapping.hpp"
#include "internal/publish/canonical.hpp"
#include "internal/publish/publish_error.hpp"
#include "internal/publish/transformer.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace {

using keyserver::authorizedapp::AuthorizedApp;
using keyserver::authorizedapp::AuthorizedAppRegistry;
using keyserver::publish::PublishError;
using keyserver::publish::PublishErrorKind;
using keyserver::service::PublishService;
using keyserver::service::ServiceContext;

constexpr std::int32_t kBatchInterval = 2704176;

keyserver::util::TimePoint BatchTime() {
  return keyserver::util::ParseRfc3339("2021-06-01T00:00:00Z");
}

struct Fixture {
  std::shared_ptr<keyserver::db::memory::MemoryRepository> repository;
  std::shared_ptr<PublishService>                          service;
};

Fixture BuildFixture() {
  Fixture fixture;
  fixture.repository = std::make_shared<keyserver::db::memory::MemoryRepository>();

  ServiceContext ctx;
  ctx.transformer = std::make_shared<const keyserver::publish::Transformer>(keyserver::publish::TransformerConfig{});
  ctx.registry    = std::make_shared<const AuthorizedAppRegistry>(
      std::vector<AuthorizedApp>{AuthorizedApp{"com.example.app", "android", {"US", "CA"}}});
  ctx.repository = fixture.repository;

  fixture.service = std::make_shared<PublishService>(ctx);
  return fixture;
}

keyserver::v1::PublishRequest Request(int keys, char seed = 'a') {
  keyserver::v1::PublishRequest request;
  request.set_app_package_name("com.example.app");
  request.set_platform("android");
  request.add_regions("us");
  request.set_verification_payload("token");
  for (int i = 0; i < keys; ++i) {
    auto* key = request.add_temporary_exposure_keys();
    key->set_key(keyserver::util::Base64Encode(std::string(15, seed) + static_cast<char>(i)));
    key->set_rolling_start_number(kBatchInterval - 144 * (i + 1));
    key->set_rolling_period(144);
    key->set_transmission_risk(2);
  }
  return request;
}

std::size_t StoredCount(PublishService& service) {
  return service.ListExposures(keyserver::db::ExposureQuery{}).size();
}

template <typename Error>
Error ExpectThrows(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e;
  }
  assert(false && "expected exception");
  throw std::logic_error("unreachable");
}

void TestAcceptedPublishIsStored() {
  auto fixture = BuildFixture();

  const auto outcome = fixture.service->Publish(Request(3), BatchTime() + std::chrono::minutes(5));
  assert(outcome.response.inserted_exposures() == 3);
  assert(outcome.response.code().empty());
  assert(outcome.exposures.size() == 3);
  assert(outcome.attestation_nonce ==
         keyserver::publish::AttestationNonce(keyserver::model::FromProto(Request(3))));

  const auto stored = fixture.service->ListExposures(keyserver::db::ExposureQuery{.region = "US"});
  assert(stored.size() == 3);
  for (const auto& exposure : stored) {
    assert(exposure.app_package_name == "com.example.app");
    assert(exposure.created_at == BatchTime());
    assert(exposure.regions == std::vector<std::string>{"US"});
    assert(exposure.local_provenance);
  }
}

void TestInvalidBatchStoresNothing() {
  auto fixture = BuildFixture();

  auto request = Request(4);
  request.mutable_temporary_exposure_keys(2)->set_rolling_period(0);

  auto error = ExpectThrows<PublishError>([&] { fixture.service->Publish(request, BatchTime()); });
  assert(error.kind() == PublishErrorKind::kInvalidPublishData);
  assert(error.cause() == PublishErrorKind::kInvalidIntervalCount);
  assert(keyserver::grpc::ErrorCode(error) == "invalid_publish_data");
  assert(StoredCount(*fixture.service) == 0);
}

void TestUnknownAppIsRejected() {
  auto fixture = BuildFixture();

  auto request = Request(1);
  request.set_app_package_name("com.example.other");

  auto error = ExpectThrows<keyserver::util::NotFound>([&] { fixture.service->Publish(request, BatchTime()); });
  assert(keyserver::grpc::ErrorCode(error) == "unknown_app");
  assert(StoredCount(*fixture.service) == 0);
}

void TestDisallowedRegionIsRejected() {
  auto fixture = BuildFixture();

  auto request = Request(1);
  request.add_regions("MX");

  ExpectThrows<keyserver::util::PermissionDenied>([&] { fixture.service->Publish(request, BatchTime()); });
  assert(StoredCount(*fixture.service) == 0);
}

void TestRepublishingKeyIsRejectedAtomically() {
  auto fixture = BuildFixture();
  fixture.service->Publish(Request(1, 'a'), BatchTime());

  // Second batch carries a new key and the one already stored.
  auto request = Request(2, 'b');
  *request.mutable_temporary_exposure_keys(0) = Request(1, 'a').temporary_exposure_keys(0);

  auto error = ExpectThrows<keyserver::util::AlreadyExists>([&] { fixture.service->Publish(request, BatchTime()); });
  assert(keyserver::grpc::ErrorCode(error) == "duplicate_key");
  assert(StoredCount(*fixture.service) == 1);
}

} // namespace

int main() {
  TestAcceptedPublishIsStored();
  TestInvalidBatchStoresNothing();
  TestUnknownAppIsRejected();
  TestDisallowedRegionIsRejected();
  TestRepublishingKeyIsRejectedAtomically();

  std::cout << "keyserver_unit_publish_service: pass\n";
  return 0;
}
