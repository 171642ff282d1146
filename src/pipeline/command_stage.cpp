#include "pipeline/command_stage.hpp"

#include "core/fs_utils.hpp"

#include <array>
#include <cstdio>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace trendloop::pipeline {

namespace {

constexpr std::string_view kContextDirective = "context:";
constexpr std::string_view kMetadataDirective = "metadata:";
constexpr std::size_t kMaxMessageLength = 512;

struct ProcessResult {
  int exit_code = -1;
  int signal = 0;
  std::string output;
};

bool RunShellCommand(const std::string& command, ProcessResult& result, std::string& error) {
  error.clear();
  result = ProcessResult{};

#if defined(_WIN32)
  FILE* pipe = _popen(command.c_str(), "r");
#else
  FILE* pipe = popen(command.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to start shell command";
    return false;
  }

  std::array<char, 4096> buffer{};
  while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
    result.output += buffer.data();
  }

#if defined(_WIN32)
  const int raw_status = _pclose(pipe);
#else
  const int raw_status = pclose(pipe);
#endif
  if (raw_status == -1) {
    error = "failed to collect shell command status";
    return false;
  }

#if defined(_WIN32)
  result.exit_code = raw_status;
#else
  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    result.signal = WTERMSIG(raw_status);
  } else {
    result.exit_code = raw_status;
  }
#endif
  return true;
}

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool SplitKeyValue(std::string_view text, std::string& key, std::string& value) {
  const auto eq = text.find('=');
  if (eq == std::string_view::npos) {
    return false;
  }
  key = std::string(Trim(text.substr(0, eq)));
  value = std::string(Trim(text.substr(eq + 1)));
  return !key.empty();
}

std::string Truncate(std::string text) {
  if (text.size() > kMaxMessageLength) {
    text.resize(kMaxMessageLength);
    text += "...";
  }
  return text;
}

} // namespace

std::string ShellQuote(const std::string& raw) {
  std::string out = "'";
  for (const char c : raw) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out += "'";
  return out;
}

CommandStage::CommandStage(std::string stage_name, CommandStageOptions options)
    : stage_name_(std::move(stage_name)), options_(std::move(options)) {}

const std::string& CommandStage::Name() const {
  return stage_name_;
}

const CommandStageOptions& CommandStage::Options() const {
  return options_;
}

StageOutcome CommandStage::Execute(RunContext& context, const std::string& run_id) {
  if (options_.command.empty()) {
    return StageOutcome::Failure("stage command is empty", "invocation_error");
  }

  const fs::path context_dir =
      options_.context_dir.empty() ? fs::temp_directory_path() : options_.context_dir;
  const fs::path context_file = context_dir / (stage_name_ + ".context");
  std::string io_error;
  if (!core::WriteTextFileAtomic(context_file, ToKeyValueText(context), io_error)) {
    return StageOutcome::Failure("cannot write context file: " + io_error, "invocation_error");
  }

  std::ostringstream shell;
  if (!options_.working_dir.empty()) {
    shell << "cd " << ShellQuote(options_.working_dir.string()) << " && ";
  }
  shell << "TRENDLOOP_RUN_ID=" << ShellQuote(run_id)
        << " TRENDLOOP_STAGE=" << ShellQuote(stage_name_)
        << " TRENDLOOP_CONTEXT_FILE=" << ShellQuote(context_file.string())
        << " && export TRENDLOOP_RUN_ID TRENDLOOP_STAGE TRENDLOOP_CONTEXT_FILE && { "
        << options_.command << "\n} 2>&1";

  ProcessResult process;
  std::string run_error;
  if (!RunShellCommand(shell.str(), process, run_error)) {
    return StageOutcome::Failure(run_error, "invocation_error");
  }

  std::map<std::string, std::string> metadata;
  std::string last_line;
  std::string context_error;
  std::istringstream lines(process.output);
  for (std::string raw_line; std::getline(lines, raw_line);) {
    const std::string_view line = Trim(raw_line);
    if (line.empty()) {
      continue;
    }

    std::string key;
    std::string value;
    if (line.rfind(kContextDirective, 0) == 0 &&
        SplitKeyValue(line.substr(kContextDirective.size()), key, value)) {
      std::string put_error;
      if (!context.Put(key, value, put_error) && context_error.empty()) {
        context_error = put_error;
      }
      continue;
    }
    if (line.rfind(kMetadataDirective, 0) == 0 &&
        SplitKeyValue(line.substr(kMetadataDirective.size()), key, value)) {
      metadata[key] = value;
      continue;
    }
    last_line = std::string(line);
  }

  if (process.signal != 0) {
    return StageOutcome::Failure("terminated by signal " + std::to_string(process.signal),
                                 "signal");
  }
  if (process.exit_code == 0) {
    if (!context_error.empty()) {
      return StageOutcome::Failure(context_error, "context_conflict");
    }
    return StageOutcome::Success(std::move(metadata));
  }
  if (process.exit_code == options_.skip_exit_code) {
    return StageOutcome::Skipped(last_line.empty() ? "stage reported nothing to do"
                                                   : Truncate(last_line));
  }

  std::string message = "exit code " + std::to_string(process.exit_code);
  if (!last_line.empty()) {
    message += ": " + Truncate(last_line);
  }
  return StageOutcome::Failure(message, "exit_code_" + std::to_string(process.exit_code));
}

} // namespace trendloop::pipeline
