#include "pipeline/snapshot_manager.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace trendloop::pipeline {

using core::errors::ErrorKind;

namespace {

constexpr std::string_view kSnapshotPrefix = "snapshot_";
constexpr std::string_view kPartialPrefix = ".partial_";

std::string BuildManifestJson(const SnapshotHandle& handle) {
  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\": \"1.0\",\n"
      << "  \"name\": " << core::JsonString(handle.name) << ",\n"
      << "  \"source_tree\": " << core::JsonString(handle.source_tree.string()) << ",\n"
      << "  \"created_at_utc\": " << core::JsonString(core::FormatUtcTimestamp(handle.created_at))
      << ",\n"
      << "  \"created_at_epoch_ms\": " << core::ToEpochMilliseconds(handle.created_at) << ",\n"
      << "  \"file_count\": " << handle.file_count << "\n"
      << "}\n";
  return out.str();
}

bool LoadManifest(const fs::path& directory, SnapshotHandle& handle, std::string& error) {
  const fs::path manifest_path = directory / kSnapshotManifestFileName;
  std::string text;
  if (!core::ReadTextFile(manifest_path, text, error)) {
    return false;
  }

  core::json::Value root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid snapshot manifest '" + manifest_path.string() + "': " + error;
    return false;
  }

  const core::json::Value* name = core::json::FindField(root, "name");
  const core::json::Value* source = core::json::FindField(root, "source_tree");
  const core::json::Value* created = core::json::FindField(root, "created_at_epoch_ms");
  const core::json::Value* file_count = core::json::FindField(root, "file_count");
  if (name == nullptr || !name->IsString() || source == nullptr || !source->IsString()) {
    error = "snapshot manifest '" + manifest_path.string() + "' is missing name/source_tree";
    return false;
  }

  std::int64_t created_ms = 0;
  std::uint64_t count = 0;
  if (created == nullptr || !core::json::TryGetInteger(*created, created_ms) ||
      file_count == nullptr || !core::json::TryGetNonNegativeInteger(*file_count, count)) {
    error = "snapshot manifest '" + manifest_path.string() +
            "' has invalid created_at_epoch_ms/file_count";
    return false;
  }
  if (name->string_value != directory.filename().string()) {
    error = "snapshot manifest name does not match directory: " + directory.string();
    return false;
  }

  handle.name = name->string_value;
  handle.directory = directory;
  handle.source_tree = source->string_value;
  handle.created_at = core::FromEpochMilliseconds(created_ms);
  handle.file_count = count;
  return true;
}

bool IsPlainName(std::string_view name) {
  return !name.empty() && name.find('/') == std::string_view::npos &&
         name.find('\\') == std::string_view::npos && name != "." && name != "..";
}

} // namespace

fs::path SnapshotHandle::TreePath() const {
  return directory / kSnapshotTreeDirName;
}

fs::path SnapshotHandle::ManifestPath() const {
  return directory / kSnapshotManifestFileName;
}

SnapshotManager::SnapshotManager(fs::path snapshot_root, SnapshotOptions options)
    : root_(std::move(snapshot_root)), options_(options) {}

const fs::path& SnapshotManager::Root() const {
  return root_;
}

bool SnapshotManager::CreateSnapshot(const fs::path& source_tree, SnapshotHandle& handle,
                                     core::errors::PipelineError& error) const {
  error.Clear();
  std::error_code ec;
  const bool source_exists = fs::exists(source_tree, ec);
  if (ec) {
    error.Set(ErrorKind::kSnapshot,
              "cannot inspect source tree '" + source_tree.string() + "': " + ec.message());
    return false;
  }
  if (!source_exists && !options_.allow_empty_source) {
    error.Set(ErrorKind::kSnapshot, "source tree does not exist: " + source_tree.string());
    return false;
  }
  if (source_exists && !fs::is_directory(source_tree, ec)) {
    error.Set(ErrorKind::kSnapshot, "source tree is not a directory: " + source_tree.string());
    return false;
  }

  fs::create_directories(root_, ec);
  if (ec) {
    error.Set(ErrorKind::kSnapshot,
              "failed to create snapshot root '" + root_.string() + "': " + ec.message());
    return false;
  }

  const auto created_at = std::chrono::system_clock::now();
  const std::string base_name =
      std::string(kSnapshotPrefix) + core::FormatCompactUtcTimestamp(created_at);
  std::string name = base_name;
  for (int suffix = 1; fs::exists(root_ / name, ec); ++suffix) {
    name = base_name + "_" + std::to_string(suffix);
  }

  const fs::path staging_dir = root_ / (std::string(kPartialPrefix) + name);
  SnapshotHandle staged;
  staged.name = name;
  staged.directory = staging_dir;
  staged.source_tree = source_tree;
  staged.created_at = created_at;

  std::string io_error;
  bool staged_ok = false;
  if (source_exists) {
    staged_ok = core::CopyTree(source_tree, staged.TreePath(), io_error) &&
                core::CountRegularFiles(staged.TreePath(), staged.file_count, io_error);
  } else {
    fs::create_directories(staged.TreePath(), ec);
    if (ec) {
      io_error = "failed to create empty snapshot tree: " + ec.message();
    }
    staged_ok = !ec;
  }
  if (staged_ok) {
    staged_ok = core::WriteTextFileAtomic(staged.ManifestPath(), BuildManifestJson(staged), io_error);
  }

  if (!staged_ok) {
    // Staging output is our own incomplete copy, never a published snapshot.
    std::error_code cleanup_ec;
    fs::remove_all(staging_dir, cleanup_ec);
    error.Set(ErrorKind::kSnapshot, io_error);
    return false;
  }

  const fs::path final_dir = root_ / name;
  fs::rename(staging_dir, final_dir, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove_all(staging_dir, cleanup_ec);
    error.Set(ErrorKind::kSnapshot,
              "failed to publish snapshot '" + final_dir.string() + "': " + ec.message());
    return false;
  }

  staged.directory = final_dir;
  handle = std::move(staged);
  return true;
}

bool SnapshotManager::Restore(const SnapshotHandle& handle, const QuarantineStore& quarantine,
                              core::errors::PipelineError& error) const {
  error.Clear();
  std::error_code ec;
  if (handle.directory.empty() || !fs::is_directory(handle.TreePath(), ec) ||
      !fs::is_regular_file(handle.ManifestPath(), ec)) {
    error.Set(ErrorKind::kSnapshot,
              "snapshot is missing or incomplete: " + handle.directory.string());
    return false;
  }
  if (handle.source_tree.empty()) {
    error.Set(ErrorKind::kSnapshot, "snapshot has no recorded source tree: " + handle.name);
    return false;
  }

  std::string quarantined_note;
  if (fs::exists(handle.source_tree, ec)) {
    QuarantineEntry entry;
    core::errors::PipelineError quarantine_error;
    if (!quarantine.Quarantine(handle.source_tree, entry, quarantine_error)) {
      error.Set(ErrorKind::kSnapshot,
                "cannot set aside current tree before restore: " + quarantine_error.message);
      return false;
    }
    quarantined_note = " (previous tree kept at '" + entry.quarantined_path.string() + "')";
  }

  std::string copy_error;
  if (!core::CopyTree(handle.TreePath(), handle.source_tree, copy_error)) {
    error.Set(ErrorKind::kSnapshot, "restore copy failed: " + copy_error + quarantined_note);
    return false;
  }
  return true;
}

bool SnapshotManager::ListSnapshots(std::vector<SnapshotHandle>& snapshots,
                                    std::string& error) const {
  snapshots.clear();
  std::error_code ec;
  if (!fs::exists(root_, ec)) {
    return true;
  }

  fs::directory_iterator it(root_, ec);
  if (ec) {
    error = "failed to read snapshot root '" + root_.string() + "': " + ec.message();
    return false;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      error = "failed while listing snapshot root '" + root_.string() + "': " + ec.message();
      return false;
    }
    const std::string name = it->path().filename().string();
    std::error_code type_ec;
    if (name.rfind(kSnapshotPrefix, 0) != 0 || !it->is_directory(type_ec)) {
      continue;
    }

    SnapshotHandle handle;
    std::string manifest_error;
    if (LoadManifest(it->path(), handle, manifest_error)) {
      snapshots.push_back(std::move(handle));
    }
  }
  if (ec) {
    error = "failed while listing snapshot root '" + root_.string() + "': " + ec.message();
    return false;
  }

  std::sort(snapshots.begin(), snapshots.end(),
            [](const SnapshotHandle& lhs, const SnapshotHandle& rhs) {
              if (lhs.created_at != rhs.created_at) {
                return lhs.created_at < rhs.created_at;
              }
              return lhs.name < rhs.name;
            });
  return true;
}

bool SnapshotManager::FindSnapshot(std::string_view name, SnapshotHandle& handle,
                                   core::errors::PipelineError& error) const {
  error.Clear();
  if (!IsPlainName(name)) {
    error.Set(ErrorKind::kSnapshot, "invalid snapshot name: " + std::string(name));
    return false;
  }

  const fs::path directory = root_ / std::string(name);
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    error.Set(ErrorKind::kSnapshot, "snapshot not found: " + std::string(name));
    return false;
  }

  std::string manifest_error;
  if (!LoadManifest(directory, handle, manifest_error)) {
    error.Set(ErrorKind::kSnapshot, manifest_error);
    return false;
  }
  return true;
}

bool SnapshotManager::PruneExpired(std::chrono::hours retention,
                                   std::chrono::system_clock::time_point now,
                                   const QuarantineStore& quarantine,
                                   std::vector<SnapshotHandle>& pruned,
                                   core::errors::PipelineError& error) const {
  error.Clear();
  pruned.clear();
  if (retention.count() <= 0) {
    error.Set(ErrorKind::kConfiguration, "snapshot retention must be positive");
    return false;
  }

  std::vector<SnapshotHandle> snapshots;
  std::string list_error;
  if (!ListSnapshots(snapshots, list_error)) {
    error.Set(ErrorKind::kSnapshot, list_error);
    return false;
  }
  if (snapshots.size() <= 1U) {
    return true;
  }

  const auto cutoff = now - retention;
  // The newest snapshot is the last recovery point; it is never pruned.
  for (std::size_t i = 0; i + 1U < snapshots.size(); ++i) {
    if (snapshots[i].created_at >= cutoff) {
      continue;
    }
    QuarantineEntry entry;
    core::errors::PipelineError quarantine_error;
    if (!quarantine.Quarantine(snapshots[i].directory, entry, quarantine_error)) {
      error.Set(ErrorKind::kQuarantine, quarantine_error.message);
      return false;
    }
    pruned.push_back(snapshots[i]);
  }
  return true;
}

} // namespace trendloop::pipeline
