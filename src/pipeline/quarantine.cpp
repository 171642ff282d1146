#include "pipeline/quarantine.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace trendloop::pipeline {

using core::errors::ErrorKind;

namespace {

fs::path PickFreeName(const fs::path& root, const std::string& stem) {
  fs::path candidate = root / stem;
  std::error_code ec;
  for (int suffix = 1; fs::exists(candidate, ec); ++suffix) {
    candidate = root / (stem + "_" + std::to_string(suffix));
  }
  return candidate;
}

} // namespace

bool MovePath(const fs::path& source, const fs::path& destination, std::string& error) {
  if (!core::EnsureParentDirectory(destination, error)) {
    return false;
  }

  std::error_code ec;
  fs::rename(source, destination, ec);
  if (!ec) {
    return true;
  }
  if (ec != std::errc::cross_device_link) {
    error = "failed to move '" + source.string() + "' to '" + destination.string() +
            "': " + ec.message();
    return false;
  }

  std::error_code type_ec;
  if (fs::is_directory(source, type_ec)) {
    if (!core::CopyTree(source, destination, error)) {
      return false;
    }
  } else {
    fs::copy(source, destination, fs::copy_options::copy_symlinks, ec);
    if (ec) {
      error = "failed to copy '" + source.string() + "' to '" + destination.string() +
              "': " + ec.message();
      return false;
    }
  }

  // The copy is complete, so the source can go: this is the second half of the move.
  fs::remove_all(source, ec);
  if (ec) {
    error = "copied '" + source.string() + "' to '" + destination.string() +
            "' but failed to remove the source: " + ec.message();
    return false;
  }
  return true;
}

QuarantineStore::QuarantineStore(fs::path root) : root_(std::move(root)) {}

const fs::path& QuarantineStore::Root() const {
  return root_;
}

bool QuarantineStore::Quarantine(const fs::path& path, QuarantineEntry& entry,
                                 core::errors::PipelineError& error) const {
  error.Clear();
  if (root_.empty()) {
    error.Set(ErrorKind::kQuarantine, "quarantine root is not configured");
    return false;
  }

  std::error_code ec;
  if (!fs::exists(fs::symlink_status(path, ec)) || ec) {
    error.Set(ErrorKind::kQuarantine, "path does not exist: " + path.string());
    return false;
  }
  if (core::IsSameOrWithin(path, root_)) {
    error.Set(ErrorKind::kQuarantine, "path is already inside quarantine: " + path.string());
    return false;
  }

  fs::create_directories(root_, ec);
  if (ec) {
    error.Set(ErrorKind::kQuarantine,
              "failed to create quarantine root '" + root_.string() + "': " + ec.message());
    return false;
  }

  const auto moved_at = std::chrono::system_clock::now();
  fs::path name = path.filename();
  if (name.empty()) {
    name = path.parent_path().filename();
  }
  const fs::path destination =
      PickFreeName(root_, core::FormatCompactUtcTimestamp(moved_at) + "_" + name.string());

  std::string move_error;
  if (!MovePath(path, destination, move_error)) {
    error.Set(ErrorKind::kQuarantine, move_error);
    return false;
  }

  entry.original_path = path;
  entry.quarantined_path = destination;
  entry.moved_at = moved_at;
  return true;
}

bool QuarantineStore::ListEntries(std::vector<fs::path>& entries, std::string& error) const {
  entries.clear();
  std::error_code ec;
  if (!fs::exists(root_, ec)) {
    return true;
  }

  fs::directory_iterator it(root_, ec);
  if (ec) {
    error = "failed to read quarantine root '" + root_.string() + "': " + ec.message();
    return false;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      error = "failed while listing quarantine root '" + root_.string() + "': " + ec.message();
      return false;
    }
    entries.push_back(it->path());
  }
  if (ec) {
    error = "failed while listing quarantine root '" + root_.string() + "': " + ec.message();
    return false;
  }

  // Entry names start with a compact UTC stamp, so name order is age order.
  std::sort(entries.begin(), entries.end());
  return true;
}

} // namespace trendloop::pipeline
