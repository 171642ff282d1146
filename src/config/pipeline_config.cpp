#include "config/pipeline_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "pipeline/command_stage.hpp"
#include "pipeline/run_context.hpp"

#include <cctype>
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace trendloop::config {

namespace {

using JsonValue = core::json::Value;
using core::json::FindField;

constexpr std::string_view kSchemaVersion = "1.0";
constexpr std::uint64_t kMaxOrdinal = 1'000'000;

const std::set<std::string, std::less<>>& KnownTopLevelKeys() {
  static const std::set<std::string, std::less<>> keys = {
      "schema_version", "pipeline_id",    "published_dir", "state_dir",
      "snapshots",      "quarantine_dir", "safety",        "stages",
  };
  return keys;
}

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsValidSlug(std::string_view value) {
  if (value.empty() || value.size() > 64U) {
    return false;
  }
  for (const char c : value) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && c != '_' && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

// Snapshots copy the published tree and restores rename it into quarantine,
// so none of the three directories may contain another.
bool DirsOverlap(const fs::path& lhs, const fs::path& rhs) {
  return core::IsSameOrWithin(lhs, rhs) || core::IsSameOrWithin(rhs, lhs);
}

// Reads an optional string field, defaulting when absent.
void ReadOptionalString(const JsonValue& object, std::string_view key, std::string path,
                        std::string fallback, std::string& out, ValidationReport& report) {
  const JsonValue* field = FindField(object, key);
  if (field == nullptr) {
    out = std::move(fallback);
    return;
  }
  if (!field->IsString() || field->string_value.empty()) {
    AddIssue(report, std::move(path), "must be a non-empty string");
    return;
  }
  out = field->string_value;
}

void ReadPositiveInteger(const JsonValue& object, std::string_view key, std::string path,
                         std::uint64_t max_value, std::uint64_t& out, ValidationReport& report) {
  const JsonValue* field = FindField(object, key);
  if (field == nullptr) {
    return;
  }
  std::uint64_t parsed = 0;
  if (!core::json::TryGetNonNegativeInteger(*field, parsed) || parsed == 0U) {
    AddIssue(report, std::move(path), "must be a positive integer");
    return;
  }
  if (parsed > max_value) {
    AddIssue(report, std::move(path), "must be <= " + std::to_string(max_value));
    return;
  }
  out = parsed;
}

fs::path ResolvePath(const fs::path& base_dir, const std::string& raw) {
  const fs::path candidate(raw);
  if (candidate.is_absolute() || base_dir.empty()) {
    return candidate.lexically_normal();
  }
  return (base_dir / candidate).lexically_normal();
}

void ParseSnapshots(const JsonValue& root, PipelineConfig& config, std::string& snapshot_dir,
                    ValidationReport& report) {
  snapshot_dir = "_backups";
  const JsonValue* snapshots = FindField(root, "snapshots");
  if (snapshots == nullptr) {
    return;
  }
  if (!snapshots->IsObject()) {
    AddIssue(report, "snapshots", "must be an object");
    return;
  }

  ReadOptionalString(*snapshots, "dir", "snapshots.dir", "_backups", snapshot_dir, report);

  std::uint64_t retention = config.snapshot_retention_days;
  ReadPositiveInteger(*snapshots, "retention_days", "snapshots.retention_days",
                      kMaxSnapshotRetentionDays, retention, report);
  config.snapshot_retention_days = static_cast<std::uint32_t>(retention);

  const JsonValue* allow_empty = FindField(*snapshots, "allow_empty_source");
  if (allow_empty != nullptr) {
    if (!allow_empty->IsBool()) {
      AddIssue(report, "snapshots.allow_empty_source", "must be a boolean");
    } else {
      config.allow_empty_source = allow_empty->bool_value;
    }
  }
}

void ParseSafety(const JsonValue& root, PipelineConfig& config, ValidationReport& report) {
  const JsonValue* safety = FindField(root, "safety");
  if (safety == nullptr) {
    return;
  }
  if (!safety->IsObject()) {
    AddIssue(report, "safety", "must be an object");
    return;
  }

  std::uint64_t max_failures = config.safety.max_consecutive_failures;
  ReadPositiveInteger(*safety, "max_consecutive_failures", "safety.max_consecutive_failures", 1000,
                      max_failures, report);
  config.safety.max_consecutive_failures = static_cast<std::uint32_t>(max_failures);

  std::uint64_t max_runtime = static_cast<std::uint64_t>(config.safety.max_runtime.count());
  ReadPositiveInteger(*safety, "max_runtime_seconds", "safety.max_runtime_seconds", 86'400,
                      max_runtime, report);
  config.safety.max_runtime = std::chrono::seconds(static_cast<std::int64_t>(max_runtime));
}

void ParseStage(const JsonValue& item, const std::string& path, StageConfig& stage,
                ValidationReport& report) {
  if (!item.IsObject()) {
    AddIssue(report, path, "must be an object");
    return;
  }

  const JsonValue* name = FindField(item, "name");
  if (name == nullptr || !name->IsString()) {
    AddIssue(report, path + ".name", "is required and must be a string");
  } else if (!IsValidSlug(name->string_value)) {
    AddIssue(report, path + ".name",
             "must be 1-64 characters of letters, digits, '_', '-' or '.'");
  } else if (name->string_value == pipeline::kOrchestratorWriter) {
    AddIssue(report, path + ".name",
             "'" + name->string_value + "' is reserved for the run orchestrator");
  } else {
    stage.name = name->string_value;
  }

  const JsonValue* ordinal = FindField(item, "ordinal");
  if (ordinal == nullptr) {
    AddIssue(report, path + ".ordinal", "is required and must be a positive integer");
  } else {
    std::uint64_t parsed = 0;
    ReadPositiveInteger(item, "ordinal", path + ".ordinal", kMaxOrdinal, parsed, report);
    stage.ordinal = static_cast<std::uint32_t>(parsed);
  }

  const JsonValue* command = FindField(item, "command");
  if (command == nullptr || !command->IsString() || command->string_value.empty()) {
    AddIssue(report, path + ".command", "is required and must be a non-empty string");
  } else {
    stage.command = command->string_value;
  }

  const JsonValue* description = FindField(item, "description");
  if (description != nullptr) {
    if (!description->IsString()) {
      AddIssue(report, path + ".description", "must be a string");
    } else {
      stage.description = description->string_value;
    }
  }

  const JsonValue* skip_code = FindField(item, "skip_exit_code");
  if (skip_code != nullptr) {
    std::int64_t parsed = 0;
    if (!core::json::TryGetInteger(*skip_code, parsed) || parsed < 1 || parsed > 255) {
      AddIssue(report, path + ".skip_exit_code", "must be an integer in [1, 255]");
    } else {
      stage.skip_exit_code = static_cast<int>(parsed);
    }
  }
}

void ParseStages(const JsonValue& root, PipelineConfig& config, ValidationReport& report) {
  const JsonValue* stages = FindField(root, "stages");
  if (stages == nullptr) {
    AddIssue(report, "stages", "is required and must list at least one stage");
    return;
  }
  if (!stages->IsArray()) {
    AddIssue(report, "stages", "must be an array");
    return;
  }
  if (stages->array_value.empty()) {
    AddIssue(report, "stages", "must list at least one stage");
    return;
  }

  std::set<std::string> names;
  std::set<std::uint32_t> ordinals;
  for (std::size_t i = 0; i < stages->array_value.size(); ++i) {
    const std::string path = "stages[" + std::to_string(i) + "]";
    StageConfig stage;
    ParseStage(stages->array_value[i], path, stage, report);
    if (!stage.name.empty() && !names.insert(stage.name).second) {
      AddIssue(report, path + ".name", "duplicates stage name '" + stage.name + "'");
    }
    if (stage.ordinal != 0U && !ordinals.insert(stage.ordinal).second) {
      AddIssue(report, path + ".ordinal",
               "duplicates ordinal " + std::to_string(stage.ordinal));
    }
    config.stages.push_back(std::move(stage));
  }
}

// Single pass over the DOM: collects issues and fills `config` as it goes.
void ParseDocument(const JsonValue& root, const fs::path& base_dir, PipelineConfig& config,
                   ValidationReport& report) {
  if (!root.IsObject()) {
    AddIssue(report, "$", "pipeline file must be a JSON object");
    return;
  }

  for (const auto& [key, unused] : root.object_value) {
    (void)unused;
    if (KnownTopLevelKeys().count(key) == 0U) {
      AddIssue(report, key, "is not a recognized field");
    }
  }

  const JsonValue* schema_version = FindField(root, "schema_version");
  if (schema_version == nullptr || !schema_version->IsString()) {
    AddIssue(report, "schema_version", "is required; use \"1.0\"");
  } else if (schema_version->string_value != kSchemaVersion) {
    AddIssue(report, "schema_version", "unsupported version '" + schema_version->string_value +
                                           "' (expected \"1.0\")");
  }

  const JsonValue* pipeline_id = FindField(root, "pipeline_id");
  if (pipeline_id == nullptr || !pipeline_id->IsString()) {
    AddIssue(report, "pipeline_id", "is required and must be a string");
  } else if (!IsValidSlug(pipeline_id->string_value)) {
    AddIssue(report, "pipeline_id",
             "must be 1-64 characters of letters, digits, '_', '-' or '.'");
  } else {
    config.pipeline_id = pipeline_id->string_value;
  }

  std::string published_dir;
  std::string state_dir;
  std::string quarantine_dir;
  std::string snapshot_dir;
  ReadOptionalString(root, "published_dir", "published_dir", "docs", published_dir, report);
  ReadOptionalString(root, "state_dir", "state_dir", "_state", state_dir, report);
  ReadOptionalString(root, "quarantine_dir", "quarantine_dir", "_deleted_items", quarantine_dir,
                     report);
  ParseSnapshots(root, config, snapshot_dir, report);
  ParseSafety(root, config, report);
  ParseStages(root, config, report);

  config.base_dir = base_dir;
  config.published_dir = ResolvePath(base_dir, published_dir);
  config.state_dir = ResolvePath(base_dir, state_dir);
  config.snapshot_dir = ResolvePath(base_dir, snapshot_dir);
  config.quarantine_dir = ResolvePath(base_dir, quarantine_dir);

  if (!published_dir.empty() && !snapshot_dir.empty() &&
      DirsOverlap(config.published_dir, config.snapshot_dir)) {
    AddIssue(report, "snapshots.dir", "must not be published_dir or nested with it");
  }
  if (!published_dir.empty() && !quarantine_dir.empty() &&
      DirsOverlap(config.published_dir, config.quarantine_dir)) {
    AddIssue(report, "quarantine_dir", "must not be published_dir or nested with it");
  }
  if (!snapshot_dir.empty() && !quarantine_dir.empty() &&
      DirsOverlap(config.snapshot_dir, config.quarantine_dir)) {
    AddIssue(report, "quarantine_dir", "must not be snapshots.dir or nested with it");
  }
}

bool ValidateAndParse(std::string_view json_text, const fs::path& base_dir, PipelineConfig& config,
                      ValidationReport& report) {
  report = ValidationReport{};
  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    report.valid = false;
    return true;
  }

  ParseDocument(root, base_dir, config, report);
  report.valid = report.issues.empty();
  return true;
}

} // namespace

fs::path PipelineConfig::LockPath() const {
  return state_dir / "trendloop.lock";
}

fs::path PipelineConfig::RunsDir() const {
  return state_dir / "runs";
}

fs::path PipelineConfig::StatePath() const {
  return state_dir / "pipeline_state.json";
}

fs::path PipelineConfig::ContextDir() const {
  return state_dir / "context";
}

bool ValidatePipelineText(std::string_view json_text, ValidationReport& report,
                          std::string& error) {
  error.clear();
  PipelineConfig scratch;
  return ValidateAndParse(json_text, fs::path(), scratch, report);
}

bool LoadPipelineConfig(const fs::path& config_path, PipelineConfig& config,
                        ValidationReport& report, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(config_path, text, error)) {
    return false;
  }

  PipelineConfig parsed;
  parsed.config_path = config_path;
  fs::path base_dir = config_path.parent_path();
  if (base_dir.empty()) {
    base_dir = ".";
  }
  ValidateAndParse(text, base_dir, parsed, report);
  if (report.valid) {
    config = std::move(parsed);
  }
  return true;
}

bool BuildStageRegistry(const PipelineConfig& config, pipeline::StageRegistry& registry,
                        core::errors::PipelineError& error) {
  for (const StageConfig& stage : config.stages) {
    pipeline::CommandStageOptions options;
    options.command = stage.command;
    options.skip_exit_code = stage.skip_exit_code;
    options.working_dir = config.base_dir;
    options.context_dir = config.ContextDir();

    pipeline::StageDefinition definition;
    definition.name = stage.name;
    definition.ordinal = stage.ordinal;
    definition.description = stage.description;
    definition.capability = std::make_shared<pipeline::CommandStage>(stage.name, std::move(options));
    if (!registry.Register(std::move(definition), error)) {
      return false;
    }
  }
  registry.Seal();
  return true;
}

} // namespace trendloop::config
