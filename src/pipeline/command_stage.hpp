#pragma once

#include "pipeline/stage.hpp"

#include <filesystem>
#include <string>

namespace trendloop::pipeline {

// Exit status a command uses to report "nothing to do" instead of failure.
inline constexpr int kDefaultSkipExitCode = 75;

struct CommandStageOptions {
  std::string command;
  int skip_exit_code = kDefaultSkipExitCode;
  // Working directory for the shell. Empty keeps the current directory.
  std::filesystem::path working_dir;
  // Where the per-stage context file is written.
  std::filesystem::path context_dir;
};

// Runs one stage as a shell command.
//
// Child environment:
//   TRENDLOOP_RUN_ID, TRENDLOOP_STAGE, TRENDLOOP_CONTEXT_FILE (key=value lines)
//
// Output protocol (stdout and stderr are merged):
//   `context: key=value`   adds a run-context value owned by this stage
//   `metadata: key=value`  attaches metadata to a successful outcome
//
// Exit status: 0 is success, `skip_exit_code` is skipped, anything else is a
// failure carrying the last plain output line.
class CommandStage final : public IStage {
public:
  CommandStage(std::string stage_name, CommandStageOptions options);

  StageOutcome Execute(RunContext& context, const std::string& run_id) override;

  const std::string& Name() const;
  const CommandStageOptions& Options() const;

private:
  std::string stage_name_;
  CommandStageOptions options_;
};

// POSIX single-quoted form of `raw`, safe to splice into `sh -c` text.
std::string ShellQuote(const std::string& raw);

} // namespace trendloop::pipeline
