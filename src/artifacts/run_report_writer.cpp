#include "artifacts/run_report_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"

namespace fs = std::filesystem;

namespace trendloop::artifacts {

bool WriteRunReportJson(const pipeline::RunReport& report, const fs::path& output_dir,
                        fs::path& written_path, std::string& error) {
  if (!report.IsFinalized()) {
    error = "run report for '" + report.RunId() + "' is not finalized";
    return false;
  }
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  written_path = output_dir / "run_report.json";
  return core::WriteTextFileAtomic(written_path, pipeline::ToJson(report), error);
}

} // namespace trendloop::artifacts
