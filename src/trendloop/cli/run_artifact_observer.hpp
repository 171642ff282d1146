#pragma once

#include "artifacts/run_summary_writer.hpp"
#include "core/logging/logger.hpp"
#include "events/event_model.hpp"
#include "pipeline/run_observer.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace trendloop::cli {

// Writes the per-run bundle under `<runs_dir>/<run_id>/`:
//   run.log, events.jsonl, run_report.json, summary.md
// and folds the finished run into `pipeline_state.json`.
//
// Artifact failures are logged and collected; they never change the verdict.
class RunArtifactObserver final : public pipeline::IRunObserver {
public:
  RunArtifactObserver(std::filesystem::path runs_dir, std::filesystem::path state_path,
                      artifacts::RecoveryHints hints, core::logging::Logger& logger);
  ~RunArtifactObserver() override;

  RunArtifactObserver(const RunArtifactObserver&) = delete;
  RunArtifactObserver& operator=(const RunArtifactObserver&) = delete;

  void OnRunStarted(const std::string& run_id) override;
  void OnSnapshotCreated(const std::string& run_id,
                         const pipeline::SnapshotHandle& snapshot) override;
  void OnStageStarted(const std::string& run_id, const pipeline::StageDefinition& stage) override;
  void OnStageFinished(const std::string& run_id, const pipeline::StageReportEntry& entry) override;
  void OnRunFinished(const pipeline::RunReport& report) override;
  // Refusals have no run directory; they go to `<state_dir>/events.jsonl`.
  void OnRunRejected(const core::errors::PipelineError& error) override;

  const std::filesystem::path& RunDir() const;
  const std::filesystem::path& ReportPath() const;
  const std::filesystem::path& SummaryPath() const;
  const std::vector<std::string>& ArtifactErrors() const;

private:
  void AppendEvent(events::EventType type, std::map<std::string, std::string> payload);
  void RecordError(std::string message);
  void DetachRunLog();

  std::filesystem::path runs_dir_;
  std::filesystem::path state_path_;
  artifacts::RecoveryHints hints_;
  core::logging::Logger& logger_;
  std::filesystem::path run_dir_;
  std::filesystem::path report_path_;
  std::filesystem::path summary_path_;
  std::unique_ptr<std::ofstream> run_log_;
  std::vector<std::string> artifact_errors_;
};

} // namespace trendloop::cli
