#pragma once

#include "pipeline/run_report.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace trendloop::state {

// Persisted record of the most recent run, kept across invocations in
// `<state_dir>/pipeline_state.json`. Operators and the scheduler read it to
// see whether the last run completed without parsing logs.
struct PipelineState {
  std::string pipeline_id;
  std::string last_run_id;
  pipeline::RunVerdict last_verdict = pipeline::RunVerdict::kCompleted;
  std::string last_abort_detail;
  std::string last_snapshot;
  std::chrono::system_clock::time_point last_started_at{};
  std::chrono::system_clock::time_point last_finished_at{};
  std::uint64_t runs_total = 0;
  // Runs in a row that did not complete. Reset by a completed run.
  std::uint64_t consecutive_aborted_runs = 0;
};

// Folds a finalized report into `state`.
void ApplyRunReport(const pipeline::RunReport& report, PipelineState& state);

bool WritePipelineStateJson(const PipelineState& state, const std::filesystem::path& output_path,
                            std::string& error);

// Loads a state file written by WritePipelineStateJson.
bool LoadPipelineState(const std::filesystem::path& state_path, PipelineState& state,
                       std::string& error);

} // namespace trendloop::state
