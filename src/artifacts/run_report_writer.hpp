#pragma once

#include "pipeline/run_report.hpp"

#include <filesystem>
#include <string>

namespace trendloop::artifacts {

// Emits `run_report.json` for a finalized run.
//
// Contract:
// - creates `output_dir` if needed.
// - the file is replaced atomically, so readers never see a partial report.
// - returns false and sets `error` on failure.
bool WriteRunReportJson(const pipeline::RunReport& report, const std::filesystem::path& output_dir,
                        std::filesystem::path& written_path, std::string& error);

} // namespace trendloop::artifacts
