#include "trendloop/state/pipeline_state_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace trendloop::state {

namespace {

using JsonValue = core::json::Value;

bool ParseRequiredStringField(const JsonValue& object, std::string_view key, std::string& value,
                              std::string& error) {
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr) {
    error = "pipeline state missing required field '" + std::string(key) + "'";
    return false;
  }
  if (!field->IsString()) {
    error = "pipeline state field '" + std::string(key) + "' must be a string";
    return false;
  }
  value = field->string_value;
  return true;
}

bool ParseRequiredUnsignedField(const JsonValue& object, std::string_view key,
                                std::uint64_t& value, std::string& error) {
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr) {
    error = "pipeline state missing required field '" + std::string(key) + "'";
    return false;
  }
  if (!core::json::TryGetNonNegativeInteger(*field, value)) {
    error = "pipeline state field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  return true;
}

bool ParseTimestampField(const JsonValue& object, std::string_view key,
                         std::chrono::system_clock::time_point& value, std::string& error) {
  const JsonValue* field = core::json::FindField(object, key);
  std::int64_t epoch_ms = 0;
  if (field == nullptr || !core::json::TryGetInteger(*field, epoch_ms)) {
    error = "pipeline state field '" + std::string(key) + "' must be an integer epoch (ms)";
    return false;
  }
  value = core::FromEpochMilliseconds(epoch_ms);
  return true;
}

} // namespace

void ApplyRunReport(const pipeline::RunReport& report, PipelineState& state) {
  state.pipeline_id = report.PipelineId();
  state.last_run_id = report.RunId();
  state.last_verdict = report.Verdict().value_or(pipeline::RunVerdict::kAbortedSafety);
  state.last_abort_detail = report.AbortDetail();
  state.last_snapshot = report.SnapshotName();
  state.last_started_at = report.StartedAt();
  state.last_finished_at = report.FinishedAt();
  ++state.runs_total;
  if (state.last_verdict == pipeline::RunVerdict::kCompleted) {
    state.consecutive_aborted_runs = 0;
  } else {
    ++state.consecutive_aborted_runs;
  }
}

bool WritePipelineStateJson(const PipelineState& state, const fs::path& output_path,
                            std::string& error) {
  error.clear();
  if (state.last_run_id.empty()) {
    error = "pipeline state last_run_id cannot be empty";
    return false;
  }

  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\": \"1.0\",\n"
      << "  \"pipeline_id\": " << core::JsonString(state.pipeline_id) << ",\n"
      << "  \"last_run_id\": " << core::JsonString(state.last_run_id) << ",\n"
      << "  \"last_verdict\": " << core::JsonString(pipeline::ToString(state.last_verdict))
      << ",\n"
      << "  \"last_abort_detail\": " << core::JsonString(state.last_abort_detail) << ",\n"
      << "  \"last_snapshot\": " << core::JsonString(state.last_snapshot) << ",\n"
      << "  \"last_started_at_epoch_ms\": " << core::ToEpochMilliseconds(state.last_started_at)
      << ",\n"
      << "  \"last_started_at_utc\": "
      << core::JsonString(core::FormatUtcTimestamp(state.last_started_at)) << ",\n"
      << "  \"last_finished_at_epoch_ms\": " << core::ToEpochMilliseconds(state.last_finished_at)
      << ",\n"
      << "  \"last_finished_at_utc\": "
      << core::JsonString(core::FormatUtcTimestamp(state.last_finished_at)) << ",\n"
      << "  \"runs_total\": " << state.runs_total << ",\n"
      << "  \"consecutive_aborted_runs\": " << state.consecutive_aborted_runs << "\n"
      << "}\n";
  return core::WriteTextFileAtomic(output_path, out.str(), error);
}

bool LoadPipelineState(const fs::path& state_path, PipelineState& state, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(state_path, text, error)) {
    return false;
  }

  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid pipeline state '" + state_path.string() + "': " + error;
    return false;
  }
  if (!root.IsObject()) {
    error = "pipeline state root must be an object";
    return false;
  }

  PipelineState parsed;
  std::string verdict_text;
  if (!ParseRequiredStringField(root, "pipeline_id", parsed.pipeline_id, error) ||
      !ParseRequiredStringField(root, "last_run_id", parsed.last_run_id, error) ||
      !ParseRequiredStringField(root, "last_verdict", verdict_text, error) ||
      !ParseRequiredStringField(root, "last_abort_detail", parsed.last_abort_detail, error) ||
      !ParseRequiredStringField(root, "last_snapshot", parsed.last_snapshot, error) ||
      !ParseTimestampField(root, "last_started_at_epoch_ms", parsed.last_started_at, error) ||
      !ParseTimestampField(root, "last_finished_at_epoch_ms", parsed.last_finished_at, error) ||
      !ParseRequiredUnsignedField(root, "runs_total", parsed.runs_total, error) ||
      !ParseRequiredUnsignedField(root, "consecutive_aborted_runs",
                                  parsed.consecutive_aborted_runs, error)) {
    return false;
  }
  if (!pipeline::ParseRunVerdict(verdict_text, parsed.last_verdict)) {
    error = "pipeline state has unknown last_verdict '" + verdict_text + "'";
    return false;
  }

  state = std::move(parsed);
  return true;
}

} // namespace trendloop::state
