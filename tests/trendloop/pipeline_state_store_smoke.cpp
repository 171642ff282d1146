#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/fs_utils.hpp"
#include "trendloop/state/pipeline_state_store.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using trendloop::pipeline::RunReport;
using trendloop::pipeline::RunVerdict;
using trendloop::state::PipelineState;
using trendloop::tests::common::AssertContains;
using trendloop::tests::common::Fail;

namespace {

RunReport FinishedReport(const std::string& run_id, RunVerdict verdict, std::string detail) {
  const auto started = std::chrono::system_clock::time_point(std::chrono::milliseconds(5'000));
  RunReport report(run_id, "daily", started);
  report.SetSnapshot("snapshot_19700101_000005_000", "/tmp/_backups/snapshot_19700101_000005_000");
  std::string error;
  if (!report.Finalize(verdict, started + std::chrono::seconds(30), std::move(detail), error)) {
    Fail("failed to finalize report: " + error);
  }
  return report;
}

} // namespace

int main() {
  const fs::path root = trendloop::tests::common::CreateUniqueTempDir("trendloop-state-smoke");
  const fs::path state_path = root / "_state" / "pipeline_state.json";

  PipelineState state;
  trendloop::state::ApplyRunReport(
      FinishedReport("run-1", RunVerdict::kAbortedTimeout, "runtime budget exhausted"), state);
  trendloop::state::ApplyRunReport(
      FinishedReport("run-2", RunVerdict::kAbortedSafety, "3 consecutive stage failures"), state);
  if (state.runs_total != 2U || state.consecutive_aborted_runs != 2U) {
    Fail("aborted runs should accumulate");
  }

  std::string error;
  if (!trendloop::state::WritePipelineStateJson(state, state_path, error)) {
    Fail("failed to write state: " + error);
  }
  const std::string text = trendloop::tests::common::ReadFileToString(state_path);
  AssertContains(text, "\"last_run_id\": \"run-2\"");
  AssertContains(text, "\"last_finished_at_utc\": \"1970-01-01T00:00:35.000Z\"");

  PipelineState loaded;
  if (!trendloop::state::LoadPipelineState(state_path, loaded, error)) {
    Fail("failed to load state: " + error);
  }
  if (loaded.last_verdict != RunVerdict::kAbortedSafety || loaded.runs_total != 2U ||
      loaded.last_abort_detail != "3 consecutive stage failures" ||
      loaded.last_started_at != state.last_started_at ||
      loaded.last_snapshot != "snapshot_19700101_000005_000") {
    Fail("loaded state does not match what was written");
  }

  trendloop::state::ApplyRunReport(FinishedReport("run-3", RunVerdict::kCompleted, ""), loaded);
  if (loaded.consecutive_aborted_runs != 0U || loaded.runs_total != 3U) {
    Fail("a completed run resets the aborted streak");
  }

  PipelineState empty;
  if (trendloop::state::WritePipelineStateJson(empty, state_path, error)) {
    Fail("state without a run id must be rejected");
  }

  std::string io_error;
  if (!trendloop::core::WriteTextFileAtomic(state_path, "{\"pipeline_id\": \"daily\"}", io_error)) {
    Fail("failed to write truncated state: " + io_error);
  }
  if (trendloop::state::LoadPipelineState(state_path, loaded, error)) {
    Fail("truncated state must fail to load");
  }
  AssertContains(error, "last_run_id");

  trendloop::tests::common::RemovePathBestEffort(root);
  return 0;
}
