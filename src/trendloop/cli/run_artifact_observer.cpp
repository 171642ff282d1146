#include "trendloop/cli/run_artifact_observer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "artifacts/run_report_writer.hpp"
#include "events/jsonl_writer.hpp"
#include "trendloop/state/pipeline_state_store.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace trendloop::cli {

RunArtifactObserver::RunArtifactObserver(fs::path runs_dir, fs::path state_path,
                                         artifacts::RecoveryHints hints,
                                         core::logging::Logger& logger)
    : runs_dir_(std::move(runs_dir)), state_path_(std::move(state_path)),
      hints_(std::move(hints)), logger_(logger) {}

RunArtifactObserver::~RunArtifactObserver() {
  DetachRunLog();
}

const fs::path& RunArtifactObserver::RunDir() const {
  return run_dir_;
}

const fs::path& RunArtifactObserver::ReportPath() const {
  return report_path_;
}

const fs::path& RunArtifactObserver::SummaryPath() const {
  return summary_path_;
}

const std::vector<std::string>& RunArtifactObserver::ArtifactErrors() const {
  return artifact_errors_;
}

void RunArtifactObserver::RecordError(std::string message) {
  logger_.Error("run artifact write failed", {{"error", message}});
  artifact_errors_.push_back(std::move(message));
}

void RunArtifactObserver::DetachRunLog() {
  if (run_log_ == nullptr) {
    return;
  }
  logger_.DetachSink(*run_log_);
  run_log_.reset();
}

void RunArtifactObserver::AppendEvent(events::EventType type,
                                      std::map<std::string, std::string> payload) {
  if (run_dir_.empty()) {
    return;
  }
  events::Event event;
  event.ts = std::chrono::system_clock::now();
  event.type = type;
  event.payload = std::move(payload);

  fs::path events_path;
  std::string error;
  if (!events::AppendEventJsonl(event, run_dir_, events_path, error)) {
    RecordError(error);
  }
}

void RunArtifactObserver::OnRunStarted(const std::string& run_id) {
  DetachRunLog();
  artifact_errors_.clear();
  run_dir_ = runs_dir_ / run_id;
  report_path_.clear();
  summary_path_.clear();

  std::string error;
  if (!artifacts::EnsureOutputDir(run_dir_, error)) {
    RecordError(error);
    run_dir_.clear();
    return;
  }

  auto log_file = std::make_unique<std::ofstream>(run_dir_ / "run.log",
                                                  std::ios::binary | std::ios::app);
  if (*log_file) {
    run_log_ = std::move(log_file);
    logger_.AttachSink(*run_log_);
  } else {
    RecordError("failed to open run log '" + (run_dir_ / "run.log").string() + "'");
  }

  AppendEvent(events::EventType::kRunStarted, {{"run_id", run_id}});
}

void RunArtifactObserver::OnSnapshotCreated(const std::string& run_id,
                                            const pipeline::SnapshotHandle& snapshot) {
  AppendEvent(events::EventType::kSnapshotCreated,
              {{"run_id", run_id},
               {"snapshot", snapshot.name},
               {"path", snapshot.directory.string()},
               {"file_count", std::to_string(snapshot.file_count)}});
}

void RunArtifactObserver::OnStageStarted(const std::string& run_id,
                                         const pipeline::StageDefinition& stage) {
  AppendEvent(events::EventType::kStageStarted,
              {{"run_id", run_id},
               {"stage", stage.name},
               {"ordinal", std::to_string(stage.ordinal)}});
}

void RunArtifactObserver::OnStageFinished(const std::string& run_id,
                                          const pipeline::StageReportEntry& entry) {
  std::map<std::string, std::string> payload = {
      {"run_id", run_id},
      {"stage", entry.stage_name},
      {"outcome", pipeline::ToString(entry.outcome.kind)},
      {"duration_ms", std::to_string(entry.duration.count())},
  };
  if (!entry.outcome.message.empty()) {
    payload["message"] = entry.outcome.message;
  }
  if (!entry.outcome.error_class.empty()) {
    payload["error_class"] = entry.outcome.error_class;
  }
  AppendEvent(events::EventType::kStageFinished, std::move(payload));
}

void RunArtifactObserver::OnRunFinished(const pipeline::RunReport& report) {
  const std::string verdict =
      report.Verdict().has_value() ? pipeline::ToString(report.Verdict().value()) : "unfinished";
  AppendEvent(events::EventType::kRunFinished,
              {{"run_id", report.RunId()}, {"verdict", verdict}, {"detail", report.AbortDetail()}});

  if (!run_dir_.empty()) {
    std::string error;
    if (!artifacts::WriteRunReportJson(report, run_dir_, report_path_, error)) {
      RecordError(error);
    }
    if (!artifacts::WriteRunSummaryMarkdown(report, hints_, run_dir_, summary_path_, error)) {
      RecordError(error);
    }
  }

  state::PipelineState pipeline_state;
  std::error_code ec;
  if (fs::exists(state_path_, ec)) {
    std::string load_error;
    if (!state::LoadPipelineState(state_path_, pipeline_state, load_error)) {
      logger_.Warn("ignoring unreadable pipeline state", {{"path", state_path_.string()},
                                                           {"error", load_error}});
      pipeline_state = state::PipelineState{};
    }
  }
  state::ApplyRunReport(report, pipeline_state);
  std::string state_error;
  if (!state::WritePipelineStateJson(pipeline_state, state_path_, state_error)) {
    RecordError(state_error);
  }

  DetachRunLog();
}

void RunArtifactObserver::OnRunRejected(const core::errors::PipelineError& error) {
  events::Event event;
  event.ts = std::chrono::system_clock::now();
  event.type = events::EventType::kRunRejected;
  event.payload = {{"error_code", std::string(core::errors::ToStableErrorCode(error.kind))},
                   {"message", error.message}};

  fs::path events_path;
  std::string write_error;
  if (!events::AppendEventJsonl(event, state_path_.parent_path(), events_path, write_error)) {
    RecordError(write_error);
  }
}

} // namespace trendloop::cli
