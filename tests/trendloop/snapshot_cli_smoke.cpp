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

  const fs::path root = trendloop::tests::common::CreateUniqueTempDir("trendloop-snapshot-cli");
  const fs::path pipeline_path = root / "pipeline.json";
  trendloop::tests::common::WriteTextFileOrFail(root / "docs" / "index.html", "home");
  trendloop::tests::common::WritePipelineFile(pipeline_path, "daily", {{"noop", "true"}});

  const auto empty_list =
      DispatchArgsCaptured({"trendloop", "snapshot", "list", pipeline_path.string()});
  if (empty_list.exit_code != 0) {
    Fail("snapshot list on a fresh pipeline should succeed");
  }
  AssertContains(empty_list.out, "no snapshots in");

  const auto no_plan = DispatchArgsCaptured({"trendloop", "recovery", pipeline_path.string()});
  AssertContains(no_plan.out, "# no snapshots available");

  for (int i = 0; i < 3; ++i) {
    const auto run = DispatchArgsCaptured({"trendloop", "run", pipeline_path.string()});
    if (run.exit_code != 0) {
      Fail("setup run failed:\n" + run.err);
    }
  }

  const auto listed = DispatchArgsCaptured({"trendloop", "snapshot", "list", pipeline_path.string()});
  AssertContains(listed.out, "snapshot_");
  AssertContains(listed.out, "files=1");

  // Nothing is older than the default 30 days.
  const auto kept = DispatchArgsCaptured({"trendloop", "snapshot", "prune", pipeline_path.string()});
  if (kept.exit_code != 0) {
    Fail("prune failed:\n" + kept.err);
  }
  AssertContains(kept.out, "pruned_snapshots: 0");

  const auto bad_retention = DispatchArgsCaptured(
      {"trendloop", "snapshot", "prune", pipeline_path.string(), "--retention-days", "zero"});
  if (bad_retention.exit_code != ToInt(ExitCode::kUsage)) {
    Fail("non-numeric retention should be a usage error");
  }

  // Huge windows are refused instead of wrapping into a short one.
  const auto huge_retention = DispatchArgsCaptured({"trendloop", "snapshot", "prune",
                                                    pipeline_path.string(), "--retention-days",
                                                    "178956971"});
  if (huge_retention.exit_code != ToInt(ExitCode::kUsage)) {
    Fail("retention above the 3650 day ceiling should be a usage error");
  }
  AssertContains(huge_retention.err, "between 1 and 3650");

  const auto longest_retention = DispatchArgsCaptured(
      {"trendloop", "snapshot", "prune", pipeline_path.string(), "--retention-days", "3650"});
  if (longest_retention.exit_code != 0) {
    Fail("the longest retention window should be accepted:\n" + longest_retention.err);
  }
  AssertContains(longest_retention.out, "pruned_snapshots: 0");

  const auto unknown_restore = DispatchArgsCaptured(
      {"trendloop", "snapshot", "restore", pipeline_path.string(), "snapshot_missing"});
  if (unknown_restore.exit_code != ToInt(ExitCode::kFailure)) {
    Fail("restoring an unknown snapshot should fail");
  }
  AssertContains(unknown_restore.err, "snapshot not found");

  trendloop::tests::common::WriteTextFileOrFail(root / "docs" / "stale.html", "stale");
  const auto quarantined = DispatchArgsCaptured(
      {"trendloop", "quarantine", pipeline_path.string(), (root / "docs" / "stale.html").string()});
  if (quarantined.exit_code != 0 || fs::exists(root / "docs" / "stale.html")) {
    Fail("quarantine command should move the file away:\n" + quarantined.err);
  }
  AssertContains(quarantined.out, "_deleted_items");
  AssertContains(trendloop::tests::common::ReadFileToString(root / "_state" / "events.jsonl"),
                 "ITEM_QUARANTINED");

  const auto bad_subcommand =
      DispatchArgsCaptured({"trendloop", "snapshot", "delete", pipeline_path.string()});
  if (bad_subcommand.exit_code != ToInt(ExitCode::kUsage)) {
    Fail("unknown snapshot subcommand should be a usage error");
  }

  trendloop::tests::common::RemovePathBestEffort(root);
  return 0;
}
