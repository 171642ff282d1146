#include "pipeline/orchestrator.hpp"

#include "pipeline/quarantine.hpp"
#include "pipeline/run_context.hpp"
#include "pipeline/run_lock.hpp"

#include <exception>
#include <utility>

namespace trendloop::pipeline {

using core::errors::ErrorKind;
using core::errors::ExitCode;
using core::errors::PipelineError;

namespace {

std::chrono::milliseconds ToMillis(std::chrono::steady_clock::duration duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration);
}

// Stage code is outside our control: anything it throws is folded into a
// failure outcome so the safety guard still sees it.
StageOutcome InvokeStage(IStage& stage, RunContext& context, const std::string& run_id) {
  try {
    return stage.Execute(context, run_id);
  } catch (const std::exception& ex) {
    return StageOutcome::Failure(std::string("unhandled exception: ") + ex.what(),
                                 std::string(kUnhandledExceptionClass));
  } catch (...) {
    return StageOutcome::Failure("unhandled non-standard exception",
                                 std::string(kUnhandledExceptionClass));
  }
}

RunPhase PhaseFor(RunVerdict verdict) {
  switch (verdict) {
  case RunVerdict::kCompleted:
    return RunPhase::kCompleted;
  case RunVerdict::kAbortedSafety:
    return RunPhase::kAbortedSafety;
  case RunVerdict::kAbortedTimeout:
    return RunPhase::kAbortedTimeout;
  case RunVerdict::kAbortedSnapshot:
    return RunPhase::kAbortedSnapshot;
  }
  return RunPhase::kCompleted;
}

// Set while any orchestrator in this process is inside Run().
std::atomic<bool>& ProcessRunFlag() {
  static std::atomic<bool> flag{false};
  return flag;
}

// Clears the run flags on every exit path.
class ScopedRunFlag {
public:
  explicit ScopedRunFlag(std::atomic<bool>& instance_flag) : instance_flag_(instance_flag) {
    instance_flag_.store(true);
  }
  ~ScopedRunFlag() {
    instance_flag_.store(false);
    ProcessRunFlag().store(false);
  }

  ScopedRunFlag(const ScopedRunFlag&) = delete;
  ScopedRunFlag& operator=(const ScopedRunFlag&) = delete;

private:
  std::atomic<bool>& instance_flag_;
};

} // namespace

const char* ToString(RunPhase phase) {
  switch (phase) {
  case RunPhase::kIdle:
    return "idle";
  case RunPhase::kSnapshotTaken:
    return "snapshot_taken";
  case RunPhase::kRunning:
    return "running";
  case RunPhase::kCompleted:
    return "completed";
  case RunPhase::kAbortedSafety:
    return "aborted_safety";
  case RunPhase::kAbortedTimeout:
    return "aborted_timeout";
  case RunPhase::kAbortedSnapshot:
    return "aborted_snapshot";
  }
  return "idle";
}

std::string MakeRunId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "run-" + std::to_string(millis);
}

ExitCode ToExitCode(const RunResult& result) {
  if (!result.accepted) {
    return result.rejection.kind == ErrorKind::kConcurrentRun ? ExitCode::kConcurrentRun
                                                              : ExitCode::kFailure;
  }
  if (!result.report.Verdict().has_value()) {
    return ExitCode::kFailure;
  }
  switch (result.report.Verdict().value()) {
  case RunVerdict::kCompleted:
    return ExitCode::kSuccess;
  case RunVerdict::kAbortedSafety:
    return ExitCode::kSafetyAbort;
  case RunVerdict::kAbortedTimeout:
    return ExitCode::kTimeoutAbort;
  case RunVerdict::kAbortedSnapshot:
    return ExitCode::kSnapshotFailed;
  }
  return ExitCode::kFailure;
}

Orchestrator::Orchestrator(const StageRegistry& registry, const SnapshotManager& snapshots,
                           OrchestratorConfig config, core::logging::Logger& logger,
                           SteadyClock clock)
    : registry_(registry), snapshots_(snapshots), config_(std::move(config)), logger_(logger),
      clock_(clock ? std::move(clock) : DefaultSteadyClock()) {}

void Orchestrator::AddObserver(IRunObserver* observer) {
  if (observer != nullptr) {
    observers_.push_back(observer);
  }
}

bool Orchestrator::IsRunActive() const {
  return run_active_.load();
}

RunPhase Orchestrator::Phase() const {
  return phase_.load();
}

void Orchestrator::SetPhase(RunPhase phase) {
  phase_.store(phase);
}

RunResult Orchestrator::Reject(PipelineError error) {
  logger_.Error("run rejected", {{"error", core::errors::FormatPipelineError(error)}});
  for (IRunObserver* observer : observers_) {
    observer->OnRunRejected(error);
  }
  RunResult result;
  result.accepted = false;
  result.rejection = std::move(error);
  return result;
}

void Orchestrator::RecordNotStarted(RunReport& report, std::size_t first_index,
                                    const std::string& reason) {
  const auto& stages = registry_.OrderedStages();
  for (std::size_t i = first_index; i < stages.size(); ++i) {
    StageReportEntry entry;
    entry.stage_name = stages[i].name;
    entry.ordinal = stages[i].ordinal;
    entry.outcome = StageOutcome::Skipped(reason);
    entry.outcome.error_class = std::string(kNotStartedClass);
    entry.started_at = std::chrono::system_clock::now();
    entry.invoked = false;

    std::string error;
    if (!report.Append(std::move(entry), error)) {
      logger_.Error("failed to record skipped stage", {{"stage", stages[i].name}, {"error", error}});
    }
  }
}

void Orchestrator::FinishRun(RunResult& result, RunVerdict verdict, std::string abort_detail) {
  std::string error;
  if (!result.report.Finalize(verdict, std::chrono::system_clock::now(), std::move(abort_detail),
                              error)) {
    logger_.Error("failed to finalize run report", {{"error", error}});
  }
  SetPhase(PhaseFor(verdict));

  logger_.Info("run finished",
               {{"verdict", ToString(verdict)},
                {"success", std::to_string(result.report.Count(OutcomeKind::kSuccess))},
                {"failure", std::to_string(result.report.Count(OutcomeKind::kFailure))},
                {"skipped", std::to_string(result.report.Count(OutcomeKind::kSkipped))}});
  for (IRunObserver* observer : observers_) {
    observer->OnRunFinished(result.report);
  }
}

RunResult Orchestrator::Run() {
  if (ProcessRunFlag().exchange(true)) {
    PipelineError error;
    error.Set(ErrorKind::kConcurrentRun,
              "another trendloop run appears active in this process (pipeline '" +
                  config_.pipeline_id + "')");
    logger_.Error("run rejected", {{"error", core::errors::FormatPipelineError(error)}});
    RunResult result;
    result.rejection = std::move(error);
    return result;
  }
  ScopedRunFlag run_flag(run_active_);

  std::string policy_error;
  if (!ValidateSafetyPolicy(config_.safety, policy_error)) {
    PipelineError error;
    error.Set(ErrorKind::kConfiguration, policy_error);
    return Reject(std::move(error));
  }

  RunLock lock;
  if (!config_.lock_path.empty()) {
    PipelineError lock_error;
    if (!lock.Acquire(config_.lock_path, lock_error)) {
      return Reject(std::move(lock_error));
    }
    if (lock.ReclaimedStale()) {
      logger_.Warn("reclaimed stale run lock", {{"lock_path", config_.lock_path.string()}});
    }
  }

  RunResult result = RunLocked();
  if (result.snapshot.has_value()) {
    PruneSnapshots();
  }
  if (lock.Held()) {
    lock.Release();
    logger_.Debug("run lock released", {{"lock_path", config_.lock_path.string()}});
  }
  return result;
}

void Orchestrator::PruneSnapshots() {
  if (!config_.snapshot_retention.has_value()) {
    return;
  }
  const QuarantineStore quarantine(config_.quarantine_dir);
  std::vector<SnapshotHandle> pruned;
  PipelineError error;
  const auto now = std::chrono::system_clock::now();
  if (!snapshots_.PruneExpired(config_.snapshot_retention.value(), now, quarantine, pruned,
                               error)) {
    logger_.Warn("snapshot retention pass failed",
                 {{"error", core::errors::FormatPipelineError(error)}});
    return;
  }
  for (const auto& snapshot : pruned) {
    logger_.Info("expired snapshot quarantined", {{"snapshot", snapshot.name}});
  }
}

// Body of Run() once the process flag and the run lock are held.
RunResult Orchestrator::RunLocked() {
  const auto started_at = std::chrono::system_clock::now();
  std::string run_id = MakeRunId(started_at);
  if (run_id == last_run_id_) {
    run_id += "-" + std::to_string(++same_millisecond_runs_);
  } else {
    same_millisecond_runs_ = 0;
  }
  last_run_id_ = MakeRunId(started_at);
  SetPhase(RunPhase::kIdle);
  logger_.SetRunId(run_id);

  RunResult result;
  result.accepted = true;
  result.report = RunReport(run_id, config_.pipeline_id, started_at);
  SafetyGuard guard(config_.safety, clock_);

  logger_.Info("run started", {{"pipeline_id", config_.pipeline_id},
                               {"stages", std::to_string(registry_.Size())},
                               {"published_dir", config_.published_dir.string()}});
  for (IRunObserver* observer : observers_) {
    observer->OnRunStarted(run_id);
  }

  SnapshotHandle snapshot;
  PipelineError snapshot_error;
  if (!snapshots_.CreateSnapshot(config_.published_dir, snapshot, snapshot_error)) {
    logger_.Error("snapshot failed; no stage will run",
                  {{"error", core::errors::FormatPipelineError(snapshot_error)}});
    RecordNotStarted(result.report, 0, "not started: snapshot failed");
    FinishRun(result, RunVerdict::kAbortedSnapshot, snapshot_error.message);
    return result;
  }
  result.snapshot = snapshot;
  result.report.SetSnapshot(snapshot.name, snapshot.directory.string());
  SetPhase(RunPhase::kSnapshotTaken);
  logger_.Info("snapshot created", {{"snapshot", snapshot.name},
                                    {"files", std::to_string(snapshot.file_count)}});
  for (IRunObserver* observer : observers_) {
    observer->OnSnapshotCreated(run_id, snapshot);
  }

  RunContext context(run_id);
  {
    std::string seed_error;
    const bool seeded = context.Put("run_id", run_id, seed_error) &&
                        context.Put("pipeline_id", config_.pipeline_id, seed_error) &&
                        context.Put("published_dir", config_.published_dir.string(), seed_error) &&
                        context.Put("snapshot_name", snapshot.name, seed_error) &&
                        context.Put("snapshot_path", snapshot.directory.string(), seed_error);
    if (!seeded) {
      logger_.Warn("failed to seed run context", {{"error", seed_error}});
    }
  }

  SetPhase(RunPhase::kRunning);
  const auto& stages = registry_.OrderedStages();
  for (std::size_t i = 0; i < stages.size(); ++i) {
    const StageDefinition& stage = stages[i];

    if (guard.CheckDeadline() == GuardDecision::kAbortTimeout) {
      const std::string detail = "runtime budget of " +
                                 std::to_string(config_.safety.max_runtime.count()) +
                                 "s exhausted before stage '" + stage.name + "'";
      logger_.Error("aborting run: runtime budget exhausted",
                    {{"next_stage", stage.name},
                     {"elapsed_ms", std::to_string(ToMillis(guard.Elapsed()).count())}});
      RecordNotStarted(result.report, i, "not started: " + detail);
      FinishRun(result, RunVerdict::kAbortedTimeout, detail);
      return result;
    }

    logger_.Info("stage started", {{"stage", stage.name},
                                   {"ordinal", std::to_string(stage.ordinal)}});
    for (IRunObserver* observer : observers_) {
      observer->OnStageStarted(run_id, stage);
    }

    StageReportEntry entry;
    entry.stage_name = stage.name;
    entry.ordinal = stage.ordinal;
    entry.started_at = std::chrono::system_clock::now();
    const auto stage_begin = clock_();
    context.SetActiveWriter(stage.name);
    entry.outcome = InvokeStage(*stage.capability, context, run_id);
    context.SetActiveWriter(std::string(kOrchestratorWriter));
    entry.duration = ToMillis(clock_() - stage_begin);

    const GuardDecision decision = guard.RecordOutcome(entry.outcome);
    const auto level = entry.outcome.IsFailure() ? core::logging::LogLevel::kWarn
                                                 : core::logging::LogLevel::kInfo;
    logger_.Log(level, "stage finished",
                {{"stage", stage.name},
                 {"outcome", ToString(entry.outcome.kind)},
                 {"duration_ms", std::to_string(entry.duration.count())},
                 {"message", entry.outcome.message},
                 {"consecutive_failures", std::to_string(guard.State().consecutive_failures)}});
    if (guard.CheckDeadline() == GuardDecision::kAbortTimeout) {
      logger_.Warn("stage overran runtime budget", {{"stage", stage.name}});
    }

    std::string append_error;
    if (!result.report.Append(entry, append_error)) {
      logger_.Error("failed to record stage outcome", {{"stage", stage.name},
                                                       {"error", append_error}});
    }
    for (IRunObserver* observer : observers_) {
      observer->OnStageFinished(run_id, entry);
    }

    if (decision == GuardDecision::kAbortConsecutiveFailures) {
      const std::string detail = std::to_string(guard.State().consecutive_failures) +
                                 " consecutive stage failures (limit " +
                                 std::to_string(config_.safety.max_consecutive_failures) +
                                 "), last failed stage '" + stage.name + "'";
      logger_.Error("aborting run: consecutive failure limit reached", {{"stage", stage.name}});
      RecordNotStarted(result.report, i + 1, "not started: " + detail);
      FinishRun(result, RunVerdict::kAbortedSafety, detail);
      return result;
    }
  }

  FinishRun(result, RunVerdict::kCompleted, "");
  return result;
}

} // namespace trendloop::pipeline
