#pragma once

#include "core/errors/exit_codes.hpp"
#include "core/errors/pipeline_error.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/run_observer.hpp"
#include "pipeline/run_report.hpp"
#include "pipeline/safety_guard.hpp"
#include "pipeline/snapshot_manager.hpp"
#include "pipeline/stage_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace trendloop::pipeline {

enum class RunPhase {
  kIdle,
  kSnapshotTaken,
  kRunning,
  kCompleted,
  kAbortedSafety,
  kAbortedTimeout,
  kAbortedSnapshot,
};

const char* ToString(RunPhase phase);

struct OrchestratorConfig {
  std::string pipeline_id = "pipeline";
  // Tree snapshotted before any stage runs.
  std::filesystem::path published_dir;
  // Cross-process lock file. Empty disables the file lock; the process-wide
  // guard still applies.
  std::filesystem::path lock_path;
  SafetyPolicy safety;
  // When set, snapshots older than this are moved into `quarantine_dir` once
  // the run has finished, before the run lock is released.
  std::optional<std::chrono::hours> snapshot_retention;
  std::filesystem::path quarantine_dir;
};

struct RunResult {
  // False when the run was refused before starting; `rejection` says why and
  // `report` is empty.
  bool accepted = false;
  core::errors::PipelineError rejection;
  RunReport report;
  std::optional<SnapshotHandle> snapshot;
};

// Drives one pipeline run end to end:
//   lock -> snapshot -> stages in ordinal order -> finalized report.
//
// Contract:
// - at most one run is active at a time, within this process (shared by every
//   orchestrator instance) and across processes sharing `lock_path`.
// - no stage runs unless a snapshot was created first.
// - before each stage the runtime budget is checked; after each stage the
//   outcome is fed to the safety guard. Either can end the run early, and
//   every stage that did not run is recorded as skipped.
// - exceptions thrown by a stage become failure outcomes.
// - snapshot retention runs under the same lock as the stages.
class Orchestrator {
public:
  Orchestrator(const StageRegistry& registry, const SnapshotManager& snapshots,
               OrchestratorConfig config, core::logging::Logger& logger,
               SteadyClock clock = DefaultSteadyClock());

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Observers must outlive the orchestrator or the runs they watch.
  void AddObserver(IRunObserver* observer);

  RunResult Run();

  // True while this instance is inside Run().
  bool IsRunActive() const;
  RunPhase Phase() const;

private:
  void SetPhase(RunPhase phase);
  RunResult Reject(core::errors::PipelineError error);
  RunResult RunLocked();
  void PruneSnapshots();
  void FinishRun(RunResult& result, RunVerdict verdict, std::string abort_detail);
  void RecordNotStarted(RunReport& report, std::size_t first_index, const std::string& reason);

  const StageRegistry& registry_;
  const SnapshotManager& snapshots_;
  OrchestratorConfig config_;
  core::logging::Logger& logger_;
  SteadyClock clock_;
  std::vector<IRunObserver*> observers_;
  std::atomic<bool> run_active_{false};
  std::atomic<RunPhase> phase_{RunPhase::kIdle};
  std::string last_run_id_;
  std::uint32_t same_millisecond_runs_ = 0;
};

// Generates a timestamp-based run id (`run-<epoch_ms>`).
std::string MakeRunId(std::chrono::system_clock::time_point now);

core::errors::ExitCode ToExitCode(const RunResult& result);

} // namespace trendloop::pipeline
