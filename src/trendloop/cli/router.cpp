#include "trendloop/cli/router.hpp"

#include "artifacts/run_summary_writer.hpp"
#include "config/pipeline_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/pipeline_error.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "events/jsonl_writer.hpp"
#include "pipeline/orchestrator.hpp"
#include "pipeline/quarantine.hpp"
#include "pipeline/run_lock.hpp"
#include "pipeline/snapshot_manager.hpp"
#include "trendloop/cli/run_artifact_observer.hpp"
#include "trendloop/state/pipeline_state_store.hpp"

#include <charconv>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace trendloop::cli {

namespace {

using core::errors::ExitCode;
using core::errors::PipelineError;

constexpr int kExitSuccess = core::errors::ToInt(ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(ExitCode::kConfigInvalid);
constexpr int kExitConcurrentRun = core::errors::ToInt(ExitCode::kConcurrentRun);

constexpr std::string_view kVersion = "0.1.0";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  trendloop run <pipeline.json> [--log-level <debug|info|warn|error>]\n"
      << "  trendloop validate <pipeline.json>\n"
      << "  trendloop snapshot list <pipeline.json>\n"
      << "  trendloop snapshot restore <pipeline.json> <snapshot_name>\n"
      << "  trendloop snapshot prune <pipeline.json> [--retention-days <n>]\n"
      << "  trendloop quarantine <pipeline.json> <path>\n"
      << "  trendloop recovery <pipeline.json>\n"
      << "  trendloop version\n";
}

void PrintSnapshotUsage(std::ostream& out) {
  out << "usage:\n"
      << "  trendloop snapshot list <pipeline.json>\n"
      << "  trendloop snapshot restore <pipeline.json> <snapshot_name>\n"
      << "  trendloop snapshot prune <pipeline.json> [--retention-days <n>]\n";
}

void PrintValidationIssues(const fs::path& config_path, const config::ValidationReport& report) {
  std::cerr << "invalid pipeline: " << config_path.string() << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Loads the pipeline file. Returns 0 on success, otherwise the exit code the
// command should return.
int LoadConfigOrExit(const fs::path& config_path, config::PipelineConfig& pipeline_config) {
  std::string error;
  config::ValidationReport report;
  if (!config::LoadPipelineConfig(config_path, pipeline_config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintValidationIssues(config_path, report);
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

artifacts::RecoveryHints BuildRecoveryHints(const config::PipelineConfig& pipeline_config) {
  return artifacts::RecoveryHints{
      .config_path = pipeline_config.config_path,
      .published_dir = pipeline_config.published_dir,
      .snapshot_dir = pipeline_config.snapshot_dir,
      .quarantine_dir = pipeline_config.quarantine_dir,
  };
}

bool ParseRetentionDays(std::string_view raw, std::uint32_t& days, std::string& error) {
  std::uint32_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc() || ptr != raw.data() + raw.size() || parsed == 0U ||
      parsed > config::kMaxSnapshotRetentionDays) {
    error = "--retention-days must be an integer between 1 and " +
            std::to_string(config::kMaxSnapshotRetentionDays) + ", got '" + std::string(raw) +
            "'";
    return false;
  }
  days = parsed;
  return true;
}

std::chrono::hours RetentionWindow(std::uint32_t days) {
  return std::chrono::hours(24) * static_cast<std::int64_t>(days);
}

// Maintenance commands take the same lock as a run so they never race one.
bool AcquireMaintenanceLock(const config::PipelineConfig& pipeline_config, pipeline::RunLock& lock,
                            int& exit_code) {
  PipelineError error;
  if (lock.Acquire(pipeline_config.LockPath(), error)) {
    return true;
  }
  std::cerr << "error: " << error.message << '\n';
  exit_code = error.kind == core::errors::ErrorKind::kConcurrentRun ? kExitConcurrentRun
                                                                    : kExitFailure;
  return false;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "trendloop " << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <pipeline.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  config::PipelineConfig pipeline_config;
  const int load_exit = LoadConfigOrExit(config_path, pipeline_config);
  if (load_exit != kExitSuccess) {
    return load_exit;
  }

  pipeline::StageRegistry registry;
  PipelineError error;
  if (!config::BuildStageRegistry(pipeline_config, registry, error)) {
    std::cerr << "error: " << core::errors::FormatPipelineError(error) << '\n';
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  for (const auto& stage : registry.OrderedStages()) {
    std::cout << "  " << stage.ordinal << ". " << stage.name << '\n';
  }
  return kExitSuccess;
}

struct RunOptions {
  fs::path config_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parse `run` args:
// - one pipeline path
// - optional `--log-level <level>`
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  bool has_path = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      if (!core::logging::ParseLogLevel(args[++i], options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option for run: " + std::string(token);
      return false;
    }
    if (has_path) {
      error = "run accepts exactly one pipeline path";
      return false;
    }
    options.config_path = fs::path(token);
    has_path = true;
  }

  if (!has_path) {
    error = "run requires <pipeline.json>";
    return false;
  }
  return true;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::PipelineConfig pipeline_config;
  const int load_exit = LoadConfigOrExit(options.config_path, pipeline_config);
  if (load_exit != kExitSuccess) {
    return load_exit;
  }

  pipeline::StageRegistry registry;
  PipelineError registry_error;
  if (!config::BuildStageRegistry(pipeline_config, registry, registry_error)) {
    std::cerr << "error: " << core::errors::FormatPipelineError(registry_error) << '\n';
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(options.log_level);
  const pipeline::SnapshotManager snapshots(
      pipeline_config.snapshot_dir,
      pipeline::SnapshotOptions{.allow_empty_source = pipeline_config.allow_empty_source});

  pipeline::OrchestratorConfig orchestrator_config;
  orchestrator_config.pipeline_id = pipeline_config.pipeline_id;
  orchestrator_config.published_dir = pipeline_config.published_dir;
  orchestrator_config.lock_path = pipeline_config.LockPath();
  orchestrator_config.safety = pipeline_config.safety;
  orchestrator_config.snapshot_retention = RetentionWindow(pipeline_config.snapshot_retention_days);
  orchestrator_config.quarantine_dir = pipeline_config.quarantine_dir;

  pipeline::Orchestrator orchestrator(registry, snapshots, orchestrator_config, logger);
  RunArtifactObserver artifact_observer(pipeline_config.RunsDir(), pipeline_config.StatePath(),
                                        BuildRecoveryHints(pipeline_config), logger);
  orchestrator.AddObserver(&artifact_observer);

  const pipeline::RunResult result = orchestrator.Run();
  if (!result.accepted) {
    std::cerr << "error: " << result.rejection.message << '\n';
    for (const auto& artifact_error : artifact_observer.ArtifactErrors()) {
      std::cerr << "warning: " << artifact_error << '\n';
    }
    return core::errors::ToInt(pipeline::ToExitCode(result));
  }

  const auto verdict = result.report.Verdict();
  std::cout << "run_id: " << result.report.RunId() << '\n';
  std::cout << "verdict: " << (verdict.has_value() ? pipeline::ToString(verdict.value()) : "-")
            << '\n';
  if (!result.report.AbortDetail().empty()) {
    std::cout << "reason: " << result.report.AbortDetail() << '\n';
  }
  std::cout << "stages: success=" << result.report.Count(pipeline::OutcomeKind::kSuccess)
            << " failure=" << result.report.Count(pipeline::OutcomeKind::kFailure)
            << " skipped=" << result.report.Count(pipeline::OutcomeKind::kSkipped) << '\n';
  if (!artifact_observer.RunDir().empty()) {
    std::cout << "run_dir: " << artifact_observer.RunDir().string() << '\n';
  }
  for (const auto& artifact_error : artifact_observer.ArtifactErrors()) {
    std::cerr << "warning: " << artifact_error << '\n';
  }
  return core::errors::ToInt(pipeline::ToExitCode(result));
}

int CommandSnapshotList(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: snapshot list requires exactly 1 argument: <pipeline.json>\n";
    return kExitUsage;
  }

  config::PipelineConfig pipeline_config;
  const int load_exit = LoadConfigOrExit(fs::path(args.front()), pipeline_config);
  if (load_exit != kExitSuccess) {
    return load_exit;
  }

  const pipeline::SnapshotManager snapshots(pipeline_config.snapshot_dir);
  std::vector<pipeline::SnapshotHandle> handles;
  std::string error;
  if (!snapshots.ListSnapshots(handles, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (handles.empty()) {
    std::cout << "no snapshots in " << pipeline_config.snapshot_dir.string() << '\n';
    return kExitSuccess;
  }
  for (const auto& handle : handles) {
    std::cout << handle.name << "  created_at_utc=" << core::FormatUtcTimestamp(handle.created_at)
              << "  files=" << handle.file_count << '\n';
  }
  return kExitSuccess;
}

int CommandSnapshotRestore(const std::vector<std::string_view>& args) {
  if (args.size() != 2) {
    std::cerr << "error: snapshot restore requires 2 arguments: <pipeline.json> <snapshot_name>\n";
    return kExitUsage;
  }

  config::PipelineConfig pipeline_config;
  const int load_exit = LoadConfigOrExit(fs::path(args[0]), pipeline_config);
  if (load_exit != kExitSuccess) {
    return load_exit;
  }

  pipeline::RunLock lock;
  int lock_exit = kExitFailure;
  if (!AcquireMaintenanceLock(pipeline_config, lock, lock_exit)) {
    return lock_exit;
  }

  const pipeline::SnapshotManager snapshots(pipeline_config.snapshot_dir);
  const pipeline::QuarantineStore quarantine(pipeline_config.quarantine_dir);
  pipeline::SnapshotHandle handle;
  PipelineError error;
  if (!snapshots.FindSnapshot(args[1], handle, error)) {
    std::cerr << "error: " << error.message << '\n';
    return kExitFailure;
  }
  // Restore into the configured published tree even if the snapshot recorded
  // a path from before the pipeline file was moved.
  handle.source_tree = pipeline_config.published_dir;
  if (!snapshots.Restore(handle, quarantine, error)) {
    std::cerr << "error: " << error.message << '\n';
    return kExitFailure;
  }

  events::Event event;
  event.ts = std::chrono::system_clock::now();
  event.type = events::EventType::kSnapshotRestored;
  event.payload = {{"snapshot", handle.name}, {"target", handle.source_tree.string()}};
  fs::path events_path;
  std::string event_error;
  if (!events::AppendEventJsonl(event, pipeline_config.state_dir, events_path, event_error)) {
    std::cerr << "warning: " << event_error << '\n';
  }

  std::cout << "restored: " << handle.name << " -> " << handle.source_tree.string() << '\n';
  return kExitSuccess;
}

int CommandSnapshotPrune(const std::vector<std::string_view>& args) {
  if (args.empty()) {
    std::cerr << "error: snapshot prune requires <pipeline.json>\n";
    return kExitUsage;
  }

  std::optional<std::uint32_t> retention_override;
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i] != "--retention-days" || i + 1 >= args.size()) {
      std::cerr << "error: unexpected snapshot prune argument: " << args[i] << '\n';
      return kExitUsage;
    }
    std::uint32_t days = 0;
    std::string error;
    if (!ParseRetentionDays(args[++i], days, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    retention_override = days;
  }

  config::PipelineConfig pipeline_config;
  const int load_exit = LoadConfigOrExit(fs::path(args.front()), pipeline_config);
  if (load_exit != kExitSuccess) {
    return load_exit;
  }

  pipeline::RunLock lock;
  int lock_exit = kExitFailure;
  if (!AcquireMaintenanceLock(pipeline_config, lock, lock_exit)) {
    return lock_exit;
  }

  const std::uint32_t days = retention_override.value_or(pipeline_config.snapshot_retention_days);
  const pipeline::SnapshotManager snapshots(pipeline_config.snapshot_dir);
  const pipeline::QuarantineStore quarantine(pipeline_config.quarantine_dir);
  std::vector<pipeline::SnapshotHandle> pruned;
  PipelineError error;
  if (!snapshots.PruneExpired(RetentionWindow(days), std::chrono::system_clock::now(),
                              quarantine, pruned, error)) {
    std::cerr << "error: " << core::errors::FormatPipelineError(error) << '\n';
    return kExitFailure;
  }

  for (const auto& snapshot : pruned) {
    std::cout << "quarantined: " << snapshot.name << '\n';
  }
  std::cout << "pruned_snapshots: " << pruned.size() << '\n';
  return kExitSuccess;
}

int CommandSnapshot(const std::vector<std::string_view>& args) {
  if (args.empty()) {
    std::cerr << "error: snapshot requires a subcommand\n";
    PrintSnapshotUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view subcommand = args.front();
  const std::vector<std::string_view> sub_args(args.begin() + 1, args.end());
  if (subcommand == "list") {
    return CommandSnapshotList(sub_args);
  }
  if (subcommand == "restore") {
    return CommandSnapshotRestore(sub_args);
  }
  if (subcommand == "prune") {
    return CommandSnapshotPrune(sub_args);
  }

  std::cerr << "error: unknown snapshot subcommand: " << subcommand << '\n';
  PrintSnapshotUsage(std::cerr);
  return kExitUsage;
}

int CommandQuarantine(const std::vector<std::string_view>& args) {
  if (args.size() != 2) {
    std::cerr << "error: quarantine requires 2 arguments: <pipeline.json> <path>\n";
    return kExitUsage;
  }

  config::PipelineConfig pipeline_config;
  const int load_exit = LoadConfigOrExit(fs::path(args[0]), pipeline_config);
  if (load_exit != kExitSuccess) {
    return load_exit;
  }

  pipeline::RunLock lock;
  int lock_exit = kExitFailure;
  if (!AcquireMaintenanceLock(pipeline_config, lock, lock_exit)) {
    return lock_exit;
  }

  const pipeline::QuarantineStore quarantine(pipeline_config.quarantine_dir);
  pipeline::QuarantineEntry entry;
  PipelineError error;
  if (!quarantine.Quarantine(fs::path(args[1]), entry, error)) {
    std::cerr << "error: " << error.message << '\n';
    return kExitFailure;
  }

  events::Event event;
  event.ts = entry.moved_at;
  event.type = events::EventType::kItemQuarantined;
  event.payload = {{"original", entry.original_path.string()},
                   {"quarantined", entry.quarantined_path.string()}};
  fs::path events_path;
  std::string event_error;
  if (!events::AppendEventJsonl(event, pipeline_config.state_dir, events_path, event_error)) {
    std::cerr << "warning: " << event_error << '\n';
  }

  std::cout << "quarantined: " << entry.original_path.string() << " -> "
            << entry.quarantined_path.string() << '\n';
  return kExitSuccess;
}

int CommandRecovery(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: recovery requires exactly 1 argument: <pipeline.json>\n";
    return kExitUsage;
  }

  config::PipelineConfig pipeline_config;
  const int load_exit = LoadConfigOrExit(fs::path(args.front()), pipeline_config);
  if (load_exit != kExitSuccess) {
    return load_exit;
  }

  const pipeline::SnapshotManager snapshots(pipeline_config.snapshot_dir);
  std::vector<pipeline::SnapshotHandle> handles;
  std::string error;
  if (!snapshots.ListSnapshots(handles, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "# trendloop recovery for pipeline '" << pipeline_config.pipeline_id << "'\n";
  std::error_code ec;
  if (fs::exists(pipeline_config.StatePath(), ec)) {
    state::PipelineState last_state;
    if (state::LoadPipelineState(pipeline_config.StatePath(), last_state, error)) {
      std::cout << "# last run: " << last_state.last_run_id << " ("
                << pipeline::ToString(last_state.last_verdict) << ")\n";
      if (!last_state.last_abort_detail.empty()) {
        std::cout << "# reason: " << last_state.last_abort_detail << '\n';
      }
    } else {
      std::cerr << "warning: " << error << '\n';
    }
  }

  const std::string latest = handles.empty() ? std::string() : handles.back().name;
  if (latest.empty()) {
    std::cout << "# no snapshots available\n";
  }
  std::cout << artifacts::BuildRecoveryCommands(BuildRecoveryHints(pipeline_config), latest);
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "snapshot") {
    return CommandSnapshot(args);
  }
  if (command == "quarantine") {
    return CommandQuarantine(args);
  }
  if (command == "recovery") {
    return CommandRecovery(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace trendloop::cli
