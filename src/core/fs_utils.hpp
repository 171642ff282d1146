#ifndef TRENDLOOP_CORE_FS_UTILS_HPP_
#define TRENDLOOP_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace trendloop::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// A reader never observes a half-written report or state file.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  // The temp file is our own partial output, not published content.
  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// Recursively copies `source` into `destination`, which must not exist yet.
// Symlinks are copied as links so a snapshot never follows them out of tree.
inline bool CopyTree(const std::filesystem::path& source, const std::filesystem::path& destination,
                     std::string& error) {
  std::error_code ec;
  if (std::filesystem::exists(destination, ec)) {
    error = "copy destination already exists: " + destination.string();
    return false;
  }

  std::filesystem::create_directories(destination, ec);
  if (ec) {
    error = "failed to create directory '" + destination.string() + "': " + ec.message();
    return false;
  }

  const auto options = std::filesystem::copy_options::recursive |
                       std::filesystem::copy_options::copy_symlinks;
  std::filesystem::copy(source, destination, options, ec);
  if (ec) {
    error = "failed to copy '" + source.string() + "' to '" + destination.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

// Counts regular files below `root`. Returns false if the tree cannot be
// traversed (permission denied, vanished entries).
inline bool CountRegularFiles(const std::filesystem::path& root, std::uint64_t& count,
                              std::string& error) {
  count = 0;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(root, ec);
  if (ec) {
    error = "failed to read directory '" + root.string() + "': " + ec.message();
    return false;
  }

  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      error = "failed while traversing '" + root.string() + "': " + ec.message();
      return false;
    }
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && !type_ec) {
      ++count;
    }
  }
  if (ec) {
    error = "failed while traversing '" + root.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// True when `candidate` is `root` or lies beneath it. Both paths are
// normalized first, so neither has to exist.
inline bool IsSameOrWithin(const std::filesystem::path& candidate,
                           const std::filesystem::path& root) {
  std::error_code ec;
  const std::filesystem::path normalized_candidate =
      std::filesystem::weakly_canonical(candidate, ec);
  if (ec) {
    return false;
  }
  const std::filesystem::path normalized_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    return false;
  }
  auto root_it = normalized_root.begin();
  auto candidate_it = normalized_candidate.begin();
  for (; root_it != normalized_root.end(); ++root_it, ++candidate_it) {
    // A trailing separator normalizes to an empty last element.
    if (root_it->empty() && std::next(root_it) == normalized_root.end()) {
      break;
    }
    if (candidate_it == normalized_candidate.end() || *candidate_it != *root_it) {
      return false;
    }
  }
  return true;
}

} // namespace trendloop::core

#endif // TRENDLOOP_CORE_FS_UTILS_HPP_
