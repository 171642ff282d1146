#ifndef TRENDLOOP_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
#define TRENDLOOP_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

#include <filesystem>
#include <string>
#include <system_error>

namespace trendloop::artifacts {

// Output-dir creation guard shared by the run artifact writers.
inline bool EnsureOutputDir(const std::filesystem::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace trendloop::artifacts

#endif // TRENDLOOP_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
