#pragma once

#include "core/errors/pipeline_error.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace trendloop::pipeline {

struct QuarantineEntry {
  std::filesystem::path original_path;
  std::filesystem::path quarantined_path;
  std::chrono::system_clock::time_point moved_at{};
};

// Soft-delete area. Nothing the pipeline replaces is ever removed outright:
// it is moved here as `<utc_stamp>_<name>` and can be moved back by hand.
class QuarantineStore {
public:
  explicit QuarantineStore(std::filesystem::path root);

  const std::filesystem::path& Root() const;

  // Moves `path` (file or directory) into the quarantine root.
  bool Quarantine(const std::filesystem::path& path, QuarantineEntry& entry,
                  core::errors::PipelineError& error) const;

  // Quarantined item paths, oldest first.
  bool ListEntries(std::vector<std::filesystem::path>& entries, std::string& error) const;

private:
  std::filesystem::path root_;
};

// Moves `source` to `destination`, falling back to copy-then-remove when a
// plain rename cannot cross filesystems.
bool MovePath(const std::filesystem::path& source, const std::filesystem::path& destination,
              std::string& error);

} // namespace trendloop::pipeline
