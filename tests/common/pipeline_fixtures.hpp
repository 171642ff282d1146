#ifndef TRENDLOOP_TESTS_COMMON_PIPELINE_FIXTURES_HPP_
#define TRENDLOOP_TESTS_COMMON_PIPELINE_FIXTURES_HPP_

#include "assertions.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace trendloop::tests::common {

struct StageFixture {
  std::string name;
  std::string command;
};

// Writes a pipeline file whose stages run `command` through the shell. Paths
// are left at their defaults so everything lands next to the file.
inline void WritePipelineFile(const std::filesystem::path& path, const std::string& pipeline_id,
                              const std::vector<StageFixture>& stages,
                              std::uint32_t max_consecutive_failures = 3,
                              bool allow_empty_source = false) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to create pipeline file: " + path.string());
  }

  out << "{\n"
      << "  \"schema_version\": \"1.0\",\n"
      << "  \"pipeline_id\": \"" << pipeline_id << "\",\n"
      << "  \"snapshots\": {\"allow_empty_source\": " << (allow_empty_source ? "true" : "false")
      << "},\n"
      << "  \"safety\": {\"max_consecutive_failures\": " << max_consecutive_failures
      << ", \"max_runtime_seconds\": 600},\n"
      << "  \"stages\": [\n";
  for (std::size_t i = 0; i < stages.size(); ++i) {
    std::string escaped;
    for (const char c : stages[i].command) {
      if (c == '"' || c == '\\') {
        escaped.push_back('\\');
      }
      escaped.push_back(c);
    }
    out << "    {\"name\": \"" << stages[i].name << "\", \"ordinal\": " << (i + 1) * 10
        << ", \"command\": \"" << escaped << "\"}" << (i + 1 < stages.size() ? ",\n" : "\n");
  }
  out << "  ]\n"
      << "}\n";
}

inline void WriteTextFileOrFail(const std::filesystem::path& path, const std::string& text) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to write file: " + path.string());
  }
  out << text;
}

// Run directories (`run-*`) under `<state_dir>/runs`, sorted by name.
inline std::vector<std::filesystem::path> CollectRunDirs(const std::filesystem::path& runs_dir) {
  std::vector<std::filesystem::path> run_dirs;
  std::error_code ec;
  if (!std::filesystem::exists(runs_dir, ec)) {
    return run_dirs;
  }
  for (const auto& entry : std::filesystem::directory_iterator(runs_dir)) {
    if (entry.is_directory() && entry.path().filename().string().rfind("run-", 0) == 0U) {
      run_dirs.push_back(entry.path());
    }
  }
  std::sort(run_dirs.begin(), run_dirs.end());
  return run_dirs;
}

// Manually advanced monotonic clock for runtime-budget tests.
class FakeSteadyClock {
public:
  std::chrono::steady_clock::time_point Now() const {
    return now_;
  }

  void Advance(std::chrono::steady_clock::duration delta) {
    now_ += delta;
  }

  // Callable view; the clock must outlive the returned function.
  auto AsFunction() {
    return [this] { return now_; };
  }

private:
  std::chrono::steady_clock::time_point now_{std::chrono::seconds(1'000)};
};

} // namespace trendloop::tests::common

#endif // TRENDLOOP_TESTS_COMMON_PIPELINE_FIXTURES_HPP_
