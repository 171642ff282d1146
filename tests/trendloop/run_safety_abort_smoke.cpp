#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/pipeline_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

int main() {
  using trendloop::core::errors::ExitCode;
  using trendloop::core::errors::ToInt;
  using trendloop::tests::common::AssertContains;
  using trendloop::tests::common::DispatchArgsCaptured;
  using trendloop::tests::common::Fail;
  using trendloop::tests::common::ReadFileToString;

  const fs::path root = trendloop::tests::common::CreateUniqueTempDir("trendloop-safety-smoke");
  const fs::path pipeline_path = root / "pipeline.json";
  trendloop::tests::common::WriteTextFileOrFail(root / "docs" / "index.html", "<h1>good</h1>");
  trendloop::tests::common::WritePipelineFile(
      pipeline_path, "daily",
      {
          {"site_rebuild", "echo '<h1>half written' > docs/index.html; echo 'build broke'; exit 1"},
          {"links", "echo 'link api down'; exit 2"},
          {"images", "echo 'image api down'; exit 3"},
          {"distribution", "touch distributed.txt"},
          {"translation", "touch translated.txt"},
      });

  const auto result = DispatchArgsCaptured({"trendloop", "run", pipeline_path.string()});
  if (result.exit_code != ToInt(ExitCode::kSafetyAbort)) {
    Fail("expected safety abort exit code:\n" + result.out + result.err);
  }
  AssertContains(result.out, "verdict: aborted_safety");
  AssertContains(result.out, "reason: 3 consecutive stage failures");
  AssertContains(result.out, "stages: success=0 failure=3 skipped=2");
  if (fs::exists(root / "distributed.txt") || fs::exists(root / "translated.txt")) {
    Fail("stages after the safety abort must not run");
  }

  const auto run_dirs = trendloop::tests::common::CollectRunDirs(root / "_state" / "runs");
  if (run_dirs.size() != 1U) {
    Fail("expected one run directory");
  }
  const std::string report = ReadFileToString(run_dirs.front() / "run_report.json");
  AssertContains(report, "\"verdict\": \"aborted_safety\"");
  AssertContains(report, "\"error_class\": \"exit_code_3\"");
  AssertContains(report, "\"invoked\": false");

  const std::string summary = ReadFileToString(run_dirs.front() / "summary.md");
  AssertContains(summary, "**aborted_safety**");
  AssertContains(summary, "## Recovery");
  AssertContains(summary, "trendloop snapshot restore " + pipeline_path.string() + " snapshot_");

  const std::string state = ReadFileToString(root / "_state" / "pipeline_state.json");
  AssertContains(state, "\"last_verdict\": \"aborted_safety\"");
  AssertContains(state, "\"consecutive_aborted_runs\": 1");

  // Operator recovery: the printed plan names the snapshot, restore brings the
  // pre-run page back and keeps the damaged tree in quarantine.
  const auto recovery = DispatchArgsCaptured({"trendloop", "recovery", pipeline_path.string()});
  if (recovery.exit_code != 0) {
    Fail("recovery command failed:\n" + recovery.err);
  }
  AssertContains(recovery.out, "(aborted_safety)");
  const std::string marker = "trendloop snapshot restore " + pipeline_path.string() + " ";
  const auto at = recovery.out.find(marker);
  if (at == std::string::npos) {
    Fail("recovery output should include a restore command:\n" + recovery.out);
  }
  const auto name_begin = at + marker.size();
  const std::string snapshot_name =
      recovery.out.substr(name_begin, recovery.out.find('\n', name_begin) - name_begin);

  const auto restore = DispatchArgsCaptured(
      {"trendloop", "snapshot", "restore", pipeline_path.string(), snapshot_name});
  if (restore.exit_code != 0) {
    Fail("restore failed:\n" + restore.err);
  }
  if (ReadFileToString(root / "docs" / "index.html") != "<h1>good</h1>") {
    Fail("restore should bring back the pre-run page");
  }
  bool damaged_tree_kept = false;
  for (const auto& entry : fs::directory_iterator(root / "_deleted_items")) {
    if (fs::exists(entry.path() / "index.html") &&
        ReadFileToString(entry.path() / "index.html").find("half written") != std::string::npos) {
      damaged_tree_kept = true;
    }
  }
  if (!damaged_tree_kept) {
    Fail("restore must quarantine the damaged tree instead of deleting it");
  }
  AssertContains(ReadFileToString(root / "_state" / "events.jsonl"), "SNAPSHOT_RESTORED");

  trendloop::tests::common::RemovePathBestEffort(root);
  return 0;
}
