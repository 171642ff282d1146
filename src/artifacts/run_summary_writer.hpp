#pragma once

#include "pipeline/run_report.hpp"

#include <filesystem>
#include <string>

namespace trendloop::artifacts {

// Paths printed in the recovery section of `summary.md`.
struct RecoveryHints {
  std::filesystem::path config_path;
  std::filesystem::path published_dir;
  std::filesystem::path snapshot_dir;
  std::filesystem::path quarantine_dir;
};

// Writes a one-page human-readable run summary (`summary.md`).
//
// Contract:
// - creates `output_dir` when missing.
// - includes verdict, per-stage table and abort detail.
// - when the run did not complete, includes copy-paste recovery commands.
// - returns false and sets `error` on failure.
bool WriteRunSummaryMarkdown(const pipeline::RunReport& report, const RecoveryHints& hints,
                             const std::filesystem::path& output_dir,
                             std::filesystem::path& written_path, std::string& error);

// Recovery commands as plain text, shared with `trendloop recovery`.
std::string BuildRecoveryCommands(const RecoveryHints& hints, const std::string& snapshot_name);

} // namespace trendloop::artifacts
