#include "../common/assertions.hpp"
#include "../common/pipeline_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "pipeline/quarantine.hpp"
#include "pipeline/snapshot_manager.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using trendloop::core::errors::PipelineError;
using trendloop::pipeline::QuarantineStore;
using trendloop::pipeline::SnapshotHandle;
using trendloop::pipeline::SnapshotManager;
using trendloop::tests::common::Fail;
using trendloop::tests::common::ReadFileToString;
using trendloop::tests::common::WriteTextFileOrFail;

int main() {
  const fs::path root = trendloop::tests::common::CreateUniqueTempDir("trendloop-snapshot-smoke");
  const fs::path docs = root / "docs";
  WriteTextFileOrFail(docs / "index.html", "<h1>v1</h1>");
  WriteTextFileOrFail(docs / "posts" / "solar.html", "solar v1");

  const SnapshotManager snapshots(root / "_backups");
  const QuarantineStore quarantine(root / "_deleted_items");

  SnapshotHandle first;
  PipelineError error;
  if (!snapshots.CreateSnapshot(docs, first, error)) {
    Fail("expected snapshot of populated tree to succeed: " + error.message);
  }
  if (first.file_count != 2U || first.name.rfind("snapshot_", 0) != 0U) {
    Fail("unexpected snapshot handle: " + first.name);
  }
  if (!fs::exists(first.ManifestPath()) || !fs::exists(first.TreePath() / "posts" / "solar.html")) {
    Fail("snapshot tree or manifest missing");
  }
  for (const auto& entry : fs::directory_iterator(root / "_backups")) {
    if (entry.path().filename().string().rfind(".partial_", 0) == 0U) {
      Fail("staging directory left behind: " + entry.path().string());
    }
  }

  // A second snapshot in the same millisecond must not collide.
  SnapshotHandle second;
  if (!snapshots.CreateSnapshot(docs, second, error) || second.name == first.name) {
    Fail("expected a distinct second snapshot");
  }

  // Simulate a bad stage: overwrite one file, delete another.
  WriteTextFileOrFail(docs / "index.html", "<h1>broken</h1>");
  fs::remove(docs / "posts" / "solar.html");

  if (!snapshots.Restore(first, quarantine, error)) {
    Fail("expected restore to succeed: " + error.message);
  }
  if (ReadFileToString(docs / "index.html") != "<h1>v1</h1>" ||
      ReadFileToString(docs / "posts" / "solar.html") != "solar v1") {
    Fail("restore did not bring back pre-run content");
  }

  std::vector<fs::path> quarantined;
  std::string list_error;
  if (!quarantine.ListEntries(quarantined, list_error) || quarantined.size() != 1U) {
    Fail("restore should quarantine the replaced tree exactly once");
  }
  if (ReadFileToString(quarantined.front() / "index.html") != "<h1>broken</h1>") {
    Fail("quarantined tree should hold the replaced content");
  }

  std::vector<SnapshotHandle> listed;
  if (!snapshots.ListSnapshots(listed, list_error) || listed.size() != 2U ||
      listed.front().name != first.name) {
    Fail("expected two snapshots listed oldest first");
  }

  SnapshotHandle found;
  if (!snapshots.FindSnapshot(second.name, found, error) || found.directory != second.directory) {
    Fail("expected FindSnapshot to locate the second snapshot");
  }
  if (snapshots.FindSnapshot("../docs", found, error)) {
    Fail("path-like snapshot names must be rejected");
  }

  // Missing source: refused unless empty sources are allowed.
  SnapshotHandle missing;
  if (snapshots.CreateSnapshot(root / "nope", missing, error)) {
    Fail("snapshot of missing tree should fail by default");
  }
  const SnapshotManager lenient(root / "_backups",
                                trendloop::pipeline::SnapshotOptions{.allow_empty_source = true});
  if (!lenient.CreateSnapshot(root / "nope", missing, error) || missing.file_count != 0U) {
    Fail("empty-source snapshot should succeed when allowed");
  }

  // Everything older than one hour, seen from a day ahead: all but the newest.
  std::vector<SnapshotHandle> pruned;
  const auto later = std::chrono::system_clock::now() + std::chrono::hours(24);
  if (!snapshots.PruneExpired(std::chrono::hours(1), later, quarantine, pruned, error)) {
    Fail("prune failed: " + error.message);
  }
  if (pruned.size() != 2U) {
    Fail("prune should quarantine every snapshot except the newest");
  }
  if (!snapshots.ListSnapshots(listed, list_error) || listed.size() != 1U ||
      listed.front().name != missing.name) {
    Fail("newest snapshot must survive pruning");
  }

  trendloop::tests::common::RemovePathBestEffort(root);
  return 0;
}
