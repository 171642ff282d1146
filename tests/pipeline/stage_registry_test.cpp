#include "pipeline/stage_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using trendloop::core::errors::ErrorKind;
using trendloop::core::errors::PipelineError;
using trendloop::pipeline::FunctionStage;
using trendloop::pipeline::StageDefinition;
using trendloop::pipeline::StageOutcome;
using trendloop::pipeline::StageRegistry;

namespace {

StageDefinition MakeStage(std::string name, std::uint32_t ordinal) {
  StageDefinition stage;
  stage.name = std::move(name);
  stage.ordinal = ordinal;
  stage.capability = std::make_shared<FunctionStage>(
      [](trendloop::pipeline::RunContext&, const std::string&) { return StageOutcome::Success(); });
  return stage;
}

} // namespace

TEST_CASE("Registry orders stages by ordinal", "[pipeline][registry]") {
  StageRegistry registry;
  PipelineError error;
  REQUIRE(registry.Register(MakeStage("site_rebuild", 50), error));
  REQUIRE(registry.Register(MakeStage("trend_analysis", 10), error));
  REQUIRE(registry.Register(MakeStage("writing", 20), error));

  std::vector<std::string> names;
  for (const auto& stage : registry.OrderedStages()) {
    names.push_back(stage.name);
  }
  REQUIRE(names == std::vector<std::string>{"trend_analysis", "writing", "site_rebuild"});
  REQUIRE(registry.Find("writing") != nullptr);
  REQUIRE(registry.Find("translation") == nullptr);
}

TEST_CASE("Registry rejects duplicate names and ordinals", "[pipeline][registry]") {
  StageRegistry registry;
  PipelineError error;
  REQUIRE(registry.Register(MakeStage("writing", 20), error));

  REQUIRE_FALSE(registry.Register(MakeStage("writing", 30), error));
  REQUIRE(error.kind == ErrorKind::kConfiguration);

  REQUIRE_FALSE(registry.Register(MakeStage("images", 20), error));
  REQUIRE(error.kind == ErrorKind::kConfiguration);
  REQUIRE(registry.Size() == 1U);
}

TEST_CASE("Registry rejects incomplete definitions", "[pipeline][registry]") {
  StageRegistry registry;
  PipelineError error;

  REQUIRE_FALSE(registry.Register(MakeStage("", 10), error));
  REQUIRE(error.kind == ErrorKind::kConfiguration);

  StageDefinition no_capability = MakeStage("images", 30);
  no_capability.capability.reset();
  REQUIRE_FALSE(registry.Register(no_capability, error));
  REQUIRE(error.kind == ErrorKind::kConfiguration);
}

TEST_CASE("Registry reserves the orchestrator writer name", "[pipeline][registry]") {
  StageRegistry registry;
  PipelineError error;
  REQUIRE_FALSE(registry.Register(MakeStage("orchestrator", 10), error));
  REQUIRE(error.kind == ErrorKind::kConfiguration);
  REQUIRE(error.message.find("reserved") != std::string::npos);
  REQUIRE(registry.Size() == 0U);
}

TEST_CASE("Sealed registry refuses new stages", "[pipeline][registry]") {
  StageRegistry registry;
  PipelineError error;
  REQUIRE(registry.Register(MakeStage("writing", 20), error));
  registry.Seal();

  REQUIRE(registry.IsSealed());
  REQUIRE_FALSE(registry.Register(MakeStage("images", 30), error));
  REQUIRE(error.kind == ErrorKind::kConfiguration);
  REQUIRE(registry.Size() == 1U);
}
