#include "artifacts/run_summary_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace trendloop::artifacts {

namespace {

std::string EscapeTableCell(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (const char c : raw) {
    if (c == '|') {
      out += "\\|";
    } else if (c == '\n' || c == '\r') {
      out += ' ';
    } else {
      out.push_back(c);
    }
  }
  return out;
}

void WriteStageTable(std::ostringstream& out, const pipeline::RunReport& report) {
  out << "## Stages\n\n";
  if (report.Entries().empty()) {
    out << "- No stages recorded.\n\n";
    return;
  }

  out << "| # | Stage | Outcome | Duration (ms) | Detail |\n";
  out << "| --- | --- | --- | --- | --- |\n";
  for (const pipeline::StageReportEntry& entry : report.Entries()) {
    out << "| " << entry.ordinal << " | " << EscapeTableCell(entry.stage_name) << " | "
        << pipeline::ToString(entry.outcome.kind) << " | " << entry.duration.count() << " | "
        << EscapeTableCell(entry.outcome.message) << " |\n";
  }
  out << '\n';
}

void WriteRecoverySection(std::ostringstream& out, const pipeline::RunReport& report,
                          const RecoveryHints& hints) {
  const auto verdict = report.Verdict();
  if (!verdict.has_value() || verdict.value() == pipeline::RunVerdict::kCompleted) {
    return;
  }

  out << "## Recovery\n\n";
  if (report.SnapshotName().empty()) {
    out << "- No snapshot was taken for this run; the published tree was not touched.\n\n";
    return;
  }
  out << "- The published tree was snapshotted before any stage ran.\n"
      << "- Replaced files are moved to the quarantine directory, never deleted.\n\n";
  out << "```bash\n" << BuildRecoveryCommands(hints, report.SnapshotName()) << "```\n\n";
}

} // namespace

std::string BuildRecoveryCommands(const RecoveryHints& hints, const std::string& snapshot_name) {
  std::ostringstream out;
  out << "# list snapshots\n"
      << "trendloop snapshot list " << hints.config_path.string() << '\n';
  if (!snapshot_name.empty()) {
    out << "# restore the pre-run tree (current tree is quarantined first)\n"
        << "trendloop snapshot restore " << hints.config_path.string() << ' ' << snapshot_name
        << '\n';
  }
  out << "# inspect quarantined items\n"
      << "ls -la " << hints.quarantine_dir.string() << '\n';
  if (!hints.snapshot_dir.empty() && !snapshot_name.empty()) {
    out << "# manual restore\n"
        << "cp -a " << (hints.snapshot_dir / snapshot_name / "tree").string() << "/. "
        << hints.published_dir.string() << "/\n";
  }
  return out.str();
}

bool WriteRunSummaryMarkdown(const pipeline::RunReport& report, const RecoveryHints& hints,
                             const fs::path& output_dir, fs::path& written_path,
                             std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  const auto verdict = report.Verdict();
  std::ostringstream out;
  out << "# Run Summary\n\n";
  out << "## Status\n\n";
  out << "**" << (verdict.has_value() ? pipeline::ToString(verdict.value()) : "unfinished")
      << "**\n\n";
  if (!report.AbortDetail().empty()) {
    out << "- reason: " << report.AbortDetail() << "\n\n";
  }

  out << "## Run Identity\n\n";
  out << "- run_id: `" << report.RunId() << "`\n";
  out << "- pipeline_id: `" << report.PipelineId() << "`\n";
  out << "- snapshot: `" << (report.SnapshotName().empty() ? "-" : report.SnapshotName())
      << "`\n";
  out << "- started_at_utc: `" << core::FormatUtcTimestamp(report.StartedAt()) << "`\n";
  out << "- finished_at_utc: `" << core::FormatUtcTimestamp(report.FinishedAt()) << "`\n\n";

  out << "## Counts\n\n";
  out << "| Outcome | Stages |\n";
  out << "| --- | --- |\n";
  out << "| success | " << report.Count(pipeline::OutcomeKind::kSuccess) << " |\n";
  out << "| failure | " << report.Count(pipeline::OutcomeKind::kFailure) << " |\n";
  out << "| skipped | " << report.Count(pipeline::OutcomeKind::kSkipped) << " |\n\n";

  WriteStageTable(out, report);
  WriteRecoverySection(out, report, hints);

  written_path = output_dir / "summary.md";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

} // namespace trendloop::artifacts
