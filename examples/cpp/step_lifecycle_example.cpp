#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <google/protobuf/util/json_util.h>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using stepdb::observability::IntField;
using stepdb::observability::StringField;

namespace {

std::string ToJson(const stepdb::v1::StepView& view) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(view, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render step view: " + std::string(status.message()));
  }
  return json;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: step_lifecycle_example <config.yaml> OR step_lifecycle_example --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = stepdb::config::ConfigLoader::LoadFromYaml(config_path);
    stepdb::observability::InitializeLogging(config);

    auto clock = std::make_shared<stepdb::util::VirtualClock>();
    auto steps = stepdb::factory::BuildStepRepository(config, clock);

    const stepdb::db::api::BuildId buildid = 1;

    auto checkout = steps->AddStep(buildid, "checkout", "pending");
    auto compile  = steps->AddStep(buildid, "compile", "pending");
    auto again    = steps->AddStep(buildid, "compile", "pending");
    STEPDB_LOG_INFO("Steps created", {StringField("first", checkout.name), StringField("second", compile.name),
                                      StringField("third", again.name)});

    clock->Advance(10);
    steps->StartStep(compile.id, clock->Seconds(), true);
    steps->SetStepStateString(compile.id, "compiling");
    steps->AddUrl(compile.id, "log", "http://example.invalid/logs/compile");
    steps->AddUrl(compile.id, "log", "http://example.invalid/logs/compile");

    clock->Advance(32.5);
    steps->FinishStep(compile.id, 0, false);

    for (const auto& view : steps->ListSteps(buildid)) {
      std::cout << ToJson(view) << "\n";
    }

    STEPDB_LOG_INFO("Example finished", {IntField("steps", static_cast<std::int64_t>(steps->ListSteps(buildid).size()))});
    stepdb::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    STEPDB_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    stepdb::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
