#include "../common/temp_dir.hpp"
#include "core/fs_utils.hpp"
#include "pipeline/command_stage.hpp"
#include "pipeline/run_context.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using trendloop::pipeline::CommandStage;
using trendloop::pipeline::CommandStageOptions;
using trendloop::pipeline::OutcomeKind;
using trendloop::pipeline::RunContext;
using trendloop::pipeline::StageOutcome;

namespace {

struct CommandFixture {
  CommandFixture() : root(trendloop::tests::common::CreateUniqueTempDir("trendloop-command-test")) {
    context.SetActiveWriter("writing");
  }

  ~CommandFixture() {
    trendloop::tests::common::RemovePathBestEffort(root);
  }

  StageOutcome RunCommand(const std::string& command, int skip_exit_code = 75) {
    CommandStageOptions options;
    options.command = command;
    options.skip_exit_code = skip_exit_code;
    options.working_dir = root;
    options.context_dir = root / "context";
    CommandStage stage("writing", options);
    return stage.Execute(context, "run-42");
  }

  fs::path root;
  RunContext context{"run-42"};
};

} // namespace

TEST_CASE("ShellQuote wraps and escapes single quotes", "[pipeline][command_stage]") {
  REQUIRE(trendloop::pipeline::ShellQuote("plain") == "'plain'");
  REQUIRE(trendloop::pipeline::ShellQuote("it's") == "'it'\\''s'");
  REQUIRE(trendloop::pipeline::ShellQuote("") == "''");
}

TEST_CASE("Exit code zero is success with metadata", "[pipeline][command_stage]") {
  CommandFixture fx;
  const StageOutcome outcome =
      fx.RunCommand("echo 'drafting'; echo 'metadata: articles=3'; echo 'metadata: words = 2400'");

  REQUIRE(outcome.kind == OutcomeKind::kSuccess);
  REQUIRE(outcome.metadata.at("articles") == "3");
  REQUIRE(outcome.metadata.at("words") == "2400");
}

TEST_CASE("Skip exit code marks the stage skipped", "[pipeline][command_stage]") {
  CommandFixture fx;
  const StageOutcome outcome = fx.RunCommand("echo 'no new trends today'; exit 75");

  REQUIRE(outcome.kind == OutcomeKind::kSkipped);
  REQUIRE(outcome.message == "no new trends today");
}

TEST_CASE("Custom skip exit code is honored", "[pipeline][command_stage]") {
  CommandFixture fx;
  REQUIRE(fx.RunCommand("exit 3", 3).kind == OutcomeKind::kSkipped);
  REQUIRE(fx.RunCommand("exit 75", 3).kind == OutcomeKind::kFailure);
}

TEST_CASE("Other exit codes fail with the last output line", "[pipeline][command_stage]") {
  CommandFixture fx;
  const StageOutcome outcome =
      fx.RunCommand("echo 'calling api'; echo 'quota exceeded' 1>&2; exit 4");

  REQUIRE(outcome.kind == OutcomeKind::kFailure);
  REQUIRE(outcome.error_class == "exit_code_4");
  REQUIRE(outcome.message == "exit code 4: quota exceeded");
}

TEST_CASE("Context lines are stored under the stage's ownership", "[pipeline][command_stage]") {
  CommandFixture fx;
  const StageOutcome outcome = fx.RunCommand("echo 'context: draft_count=5'");

  REQUIRE(outcome.IsSuccess());
  REQUIRE(fx.context.Get("draft_count") == std::string("5"));
  REQUIRE(fx.context.OwnerOf("draft_count") == "writing");
}

TEST_CASE("Overwriting another stage's context key fails the stage",
          "[pipeline][command_stage]") {
  CommandFixture fx;
  fx.context.SetActiveWriter("trend_analysis");
  std::string error;
  REQUIRE(fx.context.Put("keywords", "solar", error));
  fx.context.SetActiveWriter("writing");

  const StageOutcome outcome = fx.RunCommand("echo 'context: keywords=wind'");

  REQUIRE(outcome.IsFailure());
  REQUIRE(outcome.error_class == "context_conflict");
  REQUIRE(fx.context.Get("keywords") == std::string("solar"));
}

TEST_CASE("Child sees run identity and the context file", "[pipeline][command_stage]") {
  CommandFixture fx;
  fx.context.SetActiveWriter("trend_analysis");
  std::string error;
  REQUIRE(fx.context.Put("keywords", "solar", error));
  fx.context.SetActiveWriter("writing");

  const StageOutcome outcome = fx.RunCommand(
      "echo \"metadata: run=$TRENDLOOP_RUN_ID\"; echo \"metadata: stage=$TRENDLOOP_STAGE\"; "
      "grep -q '^keywords=solar$' \"$TRENDLOOP_CONTEXT_FILE\" || exit 9; pwd > where.txt");

  REQUIRE(outcome.IsSuccess());
  REQUIRE(outcome.metadata.at("run") == "run-42");
  REQUIRE(outcome.metadata.at("stage") == "writing");
  REQUIRE(fs::exists(fx.root / "context" / "writing.context"));
  REQUIRE(fs::exists(fx.root / "where.txt"));
}

TEST_CASE("Empty command is an invocation error", "[pipeline][command_stage]") {
  CommandFixture fx;
  const StageOutcome outcome = fx.RunCommand("");

  REQUIRE(outcome.IsFailure());
  REQUIRE(outcome.error_class == "invocation_error");
}
