#pragma once

#include "core/errors/pipeline_error.hpp"
#include "pipeline/safety_guard.hpp"
#include "pipeline/stage_registry.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace trendloop::config {

// Upper bound for snapshot retention, in days, from the file or the CLI.
inline constexpr std::uint32_t kMaxSnapshotRetentionDays = 3650;

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

struct StageConfig {
  std::string name;
  std::uint32_t ordinal = 0;
  std::string command;
  std::string description;
  int skip_exit_code = 75;
};

// Resolved pipeline definition. All paths are absolute or relative to the
// process working directory; relative paths in the file are resolved against
// the file's own directory.
struct PipelineConfig {
  std::string pipeline_id;
  std::filesystem::path config_path;
  std::filesystem::path base_dir;
  std::filesystem::path published_dir;
  std::filesystem::path state_dir;
  std::filesystem::path snapshot_dir;
  std::filesystem::path quarantine_dir;
  std::uint32_t snapshot_retention_days = 30;
  bool allow_empty_source = false;
  pipeline::SafetyPolicy safety;
  std::vector<StageConfig> stages;

  std::filesystem::path LockPath() const;
  std::filesystem::path RunsDir() const;
  std::filesystem::path StatePath() const;
  std::filesystem::path ContextDir() const;
};

// Validates pipeline JSON text.
//
// Contract:
// - returns true when validation completed, even if the document is invalid.
// - returns false only for internal failures and sets `error`.
// - parse errors are reported as an issue under path `$`.
bool ValidatePipelineText(std::string_view json_text, ValidationReport& report, std::string& error);

// Reads, validates and resolves a pipeline file.
//
// Contract:
// - false with `error` set: the file could not be read.
// - true with `report.valid == false`: `config` is untouched and `report`
//   lists every problem found.
// - true with `report.valid == true`: `config` is fully populated.
bool LoadPipelineConfig(const std::filesystem::path& config_path, PipelineConfig& config,
                        ValidationReport& report, std::string& error);

// Builds a sealed registry of shell-command stages from `config`.
bool BuildStageRegistry(const PipelineConfig& config, pipeline::StageRegistry& registry,
                        core::errors::PipelineError& error);

} // namespace trendloop::config
