#pragma once

#include "pipeline/stage.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trendloop::pipeline {

enum class RunVerdict {
  kCompleted,
  kAbortedSafety,
  kAbortedTimeout,
  kAbortedSnapshot,
};

const char* ToString(RunVerdict verdict);
bool ParseRunVerdict(std::string_view text, RunVerdict& verdict);

struct StageReportEntry {
  std::string stage_name;
  std::uint32_t ordinal = 0;
  StageOutcome outcome;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::milliseconds duration{0};
  // False for entries recorded on behalf of stages that never started.
  bool invoked = true;
};

// Append-only record of one run.
//
// Contract:
// - entries are appended in execution order and never reordered or removed.
// - `Finalize` happens exactly once; nothing may be appended afterwards.
class RunReport {
public:
  RunReport() = default;
  RunReport(std::string run_id, std::string pipeline_id,
            std::chrono::system_clock::time_point started_at);

  const std::string& RunId() const;
  const std::string& PipelineId() const;
  std::chrono::system_clock::time_point StartedAt() const;

  void SetSnapshot(std::string name, std::string path);
  const std::string& SnapshotName() const;
  const std::string& SnapshotPath() const;

  bool Append(StageReportEntry entry, std::string& error);

  bool Finalize(RunVerdict verdict, std::chrono::system_clock::time_point finished_at,
                std::string abort_detail, std::string& error);

  bool IsFinalized() const;
  std::optional<RunVerdict> Verdict() const;
  std::chrono::system_clock::time_point FinishedAt() const;
  const std::string& AbortDetail() const;

  const std::vector<StageReportEntry>& Entries() const;
  std::size_t Count(OutcomeKind kind) const;

private:
  std::string run_id_;
  std::string pipeline_id_;
  std::chrono::system_clock::time_point started_at_{};
  std::chrono::system_clock::time_point finished_at_{};
  std::string snapshot_name_;
  std::string snapshot_path_;
  std::vector<StageReportEntry> entries_;
  std::optional<RunVerdict> verdict_;
  std::string abort_detail_;
};

// Stable JSON form written to `run_report.json`.
std::string ToJson(const RunReport& report);

} // namespace trendloop::pipeline
