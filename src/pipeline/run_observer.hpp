#pragma once

#include "core/errors/pipeline_error.hpp"
#include "pipeline/run_report.hpp"
#include "pipeline/snapshot_manager.hpp"
#include "pipeline/stage.hpp"

#include <string>

namespace trendloop::pipeline {

// Hooks into the run lifecycle for logging and artifact writing. Callbacks
// run synchronously on the orchestrator thread, in lifecycle order.
class IRunObserver {
public:
  virtual ~IRunObserver() = default;

  virtual void OnRunStarted(const std::string& /*run_id*/) {}
  virtual void OnSnapshotCreated(const std::string& /*run_id*/, const SnapshotHandle& /*snapshot*/) {}
  virtual void OnStageStarted(const std::string& /*run_id*/, const StageDefinition& /*stage*/) {}
  virtual void OnStageFinished(const std::string& /*run_id*/, const StageReportEntry& /*entry*/) {}
  virtual void OnRunFinished(const RunReport& /*report*/) {}
  // A run refused before it started (lock conflict, unwritable state dir).
  virtual void OnRunRejected(const core::errors::PipelineError& /*error*/) {}
};

} // namespace trendloop::pipeline
