#include "pipeline/run_report.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <utility>

namespace trendloop::pipeline {

const char* ToString(RunVerdict verdict) {
  switch (verdict) {
  case RunVerdict::kCompleted:
    return "completed";
  case RunVerdict::kAbortedSafety:
    return "aborted_safety";
  case RunVerdict::kAbortedTimeout:
    return "aborted_timeout";
  case RunVerdict::kAbortedSnapshot:
    return "aborted_snapshot";
  }
  return "completed";
}

bool ParseRunVerdict(std::string_view text, RunVerdict& verdict) {
  for (const RunVerdict candidate : {RunVerdict::kCompleted, RunVerdict::kAbortedSafety,
                                     RunVerdict::kAbortedTimeout, RunVerdict::kAbortedSnapshot}) {
    if (text == ToString(candidate)) {
      verdict = candidate;
      return true;
    }
  }
  return false;
}

RunReport::RunReport(std::string run_id, std::string pipeline_id,
                     std::chrono::system_clock::time_point started_at)
    : run_id_(std::move(run_id)), pipeline_id_(std::move(pipeline_id)), started_at_(started_at),
      finished_at_(started_at) {}

const std::string& RunReport::RunId() const {
  return run_id_;
}

const std::string& RunReport::PipelineId() const {
  return pipeline_id_;
}

std::chrono::system_clock::time_point RunReport::StartedAt() const {
  return started_at_;
}

void RunReport::SetSnapshot(std::string name, std::string path) {
  snapshot_name_ = std::move(name);
  snapshot_path_ = std::move(path);
}

const std::string& RunReport::SnapshotName() const {
  return snapshot_name_;
}

const std::string& RunReport::SnapshotPath() const {
  return snapshot_path_;
}

bool RunReport::Append(StageReportEntry entry, std::string& error) {
  if (verdict_.has_value()) {
    error = "run report is finalized; cannot append stage '" + entry.stage_name + "'";
    return false;
  }
  entries_.push_back(std::move(entry));
  return true;
}

bool RunReport::Finalize(RunVerdict verdict, std::chrono::system_clock::time_point finished_at,
                         std::string abort_detail, std::string& error) {
  if (verdict_.has_value()) {
    error = "run report is already finalized as " + std::string(ToString(verdict_.value()));
    return false;
  }
  verdict_ = verdict;
  finished_at_ = finished_at;
  abort_detail_ = std::move(abort_detail);
  return true;
}

bool RunReport::IsFinalized() const {
  return verdict_.has_value();
}

std::optional<RunVerdict> RunReport::Verdict() const {
  return verdict_;
}

std::chrono::system_clock::time_point RunReport::FinishedAt() const {
  return finished_at_;
}

const std::string& RunReport::AbortDetail() const {
  return abort_detail_;
}

const std::vector<StageReportEntry>& RunReport::Entries() const {
  return entries_;
}

std::size_t RunReport::Count(OutcomeKind kind) const {
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [kind](const StageReportEntry& entry) { return entry.outcome.kind == kind; }));
}

std::string ToJson(const RunReport& report) {
  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\": \"1.0\",\n"
      << "  \"run_id\": " << core::JsonString(report.RunId()) << ",\n"
      << "  \"pipeline_id\": " << core::JsonString(report.PipelineId()) << ",\n"
      << "  \"verdict\": "
      << (report.Verdict().has_value() ? core::JsonString(ToString(report.Verdict().value()))
                                       : std::string("null"))
      << ",\n"
      << "  \"abort_detail\": " << core::JsonString(report.AbortDetail()) << ",\n"
      << "  \"started_at_utc\": " << core::JsonString(core::FormatUtcTimestamp(report.StartedAt()))
      << ",\n"
      << "  \"finished_at_utc\": "
      << core::JsonString(core::FormatUtcTimestamp(report.FinishedAt())) << ",\n"
      << "  \"snapshot\": {\"name\": " << core::JsonString(report.SnapshotName())
      << ", \"path\": " << core::JsonString(report.SnapshotPath()) << "},\n"
      << "  \"counts\": {\"success\": " << report.Count(OutcomeKind::kSuccess)
      << ", \"failure\": " << report.Count(OutcomeKind::kFailure)
      << ", \"skipped\": " << report.Count(OutcomeKind::kSkipped) << "},\n"
      << "  \"stages\": [";

  bool first = true;
  for (const StageReportEntry& entry : report.Entries()) {
    out << (first ? "\n" : ",\n");
    first = false;
    out << "    {\"name\": " << core::JsonString(entry.stage_name)
        << ", \"ordinal\": " << entry.ordinal
        << ", \"outcome\": " << core::JsonString(ToString(entry.outcome.kind))
        << ", \"invoked\": " << (entry.invoked ? "true" : "false")
        << ", \"started_at_utc\": " << core::JsonString(core::FormatUtcTimestamp(entry.started_at))
        << ", \"duration_ms\": " << entry.duration.count()
        << ", \"message\": " << core::JsonString(entry.outcome.message)
        << ", \"error_class\": " << core::JsonString(entry.outcome.error_class)
        << ", \"metadata\": " << core::JsonStringMap(entry.outcome.metadata) << "}";
  }
  out << (first ? "]\n" : "\n  ]\n") << "}\n";
  return out.str();
}

} // namespace trendloop::pipeline
