#pragma once

#include "core/errors/pipeline_error.hpp"
#include "pipeline/quarantine.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace trendloop::pipeline {

inline constexpr std::string_view kSnapshotManifestFileName = "snapshot.json";
inline constexpr std::string_view kSnapshotTreeDirName = "tree";

// Durable point-in-time copy of the published tree.
//
// On-disk layout:
//   <snapshot_root>/<name>/snapshot.json
//   <snapshot_root>/<name>/tree/...
struct SnapshotHandle {
  std::string name;
  std::filesystem::path directory;
  std::filesystem::path source_tree;
  std::chrono::system_clock::time_point created_at{};
  std::uint64_t file_count = 0;

  std::filesystem::path TreePath() const;
  std::filesystem::path ManifestPath() const;
};

struct SnapshotOptions {
  // When the source tree does not exist yet (first ever run), record an empty
  // snapshot instead of failing.
  bool allow_empty_source = false;
};

// Creates, restores, lists and prunes snapshots under one root directory.
//
// Contract:
// - a snapshot directory only becomes visible once its copy and manifest are
//   complete; a failed copy never leaves a listable snapshot behind.
// - restore never deletes the current tree: it is quarantined first.
// - pruning quarantines expired snapshots and always keeps the newest one.
class SnapshotManager {
public:
  explicit SnapshotManager(std::filesystem::path snapshot_root, SnapshotOptions options = {});

  const std::filesystem::path& Root() const;

  bool CreateSnapshot(const std::filesystem::path& source_tree, SnapshotHandle& handle,
                      core::errors::PipelineError& error) const;

  // Replaces `handle.source_tree` with the snapshot contents.
  bool Restore(const SnapshotHandle& handle, const QuarantineStore& quarantine,
               core::errors::PipelineError& error) const;

  // Valid snapshots sorted oldest first. Directories without a readable
  // manifest are ignored.
  bool ListSnapshots(std::vector<SnapshotHandle>& snapshots, std::string& error) const;

  bool FindSnapshot(std::string_view name, SnapshotHandle& handle,
                    core::errors::PipelineError& error) const;

  bool PruneExpired(std::chrono::hours retention, std::chrono::system_clock::time_point now,
                    const QuarantineStore& quarantine, std::vector<SnapshotHandle>& pruned,
                    core::errors::PipelineError& error) const;

private:
  std::filesystem::path root_;
  SnapshotOptions options_;
};

} // namespace trendloop::pipeline
