#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/model/publish_mapping.hpp"
#include "internal/model/region.hpp"
#include "internal/observability/logging.hpp"
#include "internal/publish/canonical.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

static void Usage() {
  std::cerr << "Usage:\n"
            << "  keyserverctl --config <config.yaml> nonce <request.json>\n"
            << "  keyserverctl --config <config.yaml> publish <request.json> [batch_time_rfc3339]\n"
            << "  keyserverctl --config <config.yaml> list [region]\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw keyserver::util::InvalidArgument("cannot open " + path);
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

static int RunNonce(const std::string& request_path) {
  const auto request    = keyserver::model::ParsePublishRequestJson(ReadFile(request_path));
  const auto submission = keyserver::model::FromProto(request);

  std::cout << "cleartext: " << keyserver::publish::CanonicalCleartext(submission) << "\n"
            << "nonce:     " << keyserver::publish::AttestationNonce(submission) << "\n";
  return 0;
}

static int RunPublish(keyserver::factory::Application& app, const std::string& request_path, const std::string& batch_time) {
  keyserver::v1::PublishResponse response;
  try {
    const auto request = keyserver::model::ParsePublishRequestJson(ReadFile(request_path));
    const auto when    = batch_time.empty() ? keyserver::util::Now() : keyserver::util::ParseRfc3339(batch_time);

    auto outcome = app.publish_service->Publish(request, when);
    response     = outcome.response;
  } catch (const std::exception& e) {
    const auto status = keyserver::grpc::ToStatus(e);
    response.set_error(status.error_message());
    response.set_code(keyserver::grpc::ErrorCode(e));
    std::cout << keyserver::model::ToJson(response) << "\n";
    return status.error_code() == ::grpc::StatusCode::INTERNAL ? 2 : 1;
  }

  std::cout << keyserver::model::ToJson(response) << "\n";
  return 0;
}

static int RunList(keyserver::factory::Application& app, const std::string& region) {
  keyserver::db::ExposureQuery query;
  if (!region.empty()) {
    query.region = keyserver::model::UpcaseRegion(region);
  }

  for (const auto& exposure : app.publish_service->ListExposures(query)) {
    const std::string raw_key(exposure.exposure_key.begin(), exposure.exposure_key.end());

    std::string regions;
    for (const auto& r : exposure.regions) {
      if (!regions.empty()) regions += ",";
      regions += r;
    }

    std::cout << keyserver::util::Base64Encode(raw_key) << " interval=" << exposure.interval_number << " count=" << exposure.interval_count
              << " risk=" << exposure.transmission_risk << " app=" << exposure.app_package_name << " regions=" << regions
              << " created_at=" << keyserver::util::FormatRfc3339(exposure.created_at) << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() < 3 || args[0] != "--config") {
    Usage();
    return 1;
  }

  const std::string& config_path = args[1];
  const std::string& command     = args[2];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = keyserver::config::ConfigLoader::LoadFromYaml(config_path);
    keyserver::observability::InitializeLogging(config);

    int rc = 1;
    if (command == "nonce" && args.size() == 4) {
      rc = RunNonce(args[3]);
    } else if (command == "publish" && (args.size() == 4 || args.size() == 5)) {
      auto app = keyserver::factory::Build(config);
      rc       = RunPublish(app, args[3], args.size() == 5 ? args[4] : std::string{});
    } else if (command == "list" && (args.size() == 3 || args.size() == 4)) {
      auto app = keyserver::factory::Build(config);
      rc       = RunList(app, args.size() == 4 ? args[3] : std::string{});
    } else {
      Usage();
    }

    keyserver::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    KEYSERVER_LOG_ERROR("Fatal error", {keyserver::observability::StringField("error", e.what())});
    std::cerr << "keyserverctl: " << e.what() << std::endl;
    keyserver::observability::ShutdownLogging();
    return 2;
  }
}
