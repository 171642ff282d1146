#pragma once

#include <string>
#include <string_view>

namespace trendloop::core::errors {

// Stable classification for failures that end or prevent a run. Stage-level
// failures are not errors here: they are StageOutcome values and flow into the
// run report instead.
enum class ErrorKind {
  kNone,
  kConfiguration,
  kSnapshot,
  kConcurrentRun,
  kQuarantine,
  kIo,
};

// Grep-friendly code used in logs and `error:` lines.
constexpr std::string_view ToStableErrorCode(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "OK";
  case ErrorKind::kConfiguration:
    return "CONFIGURATION_ERROR";
  case ErrorKind::kSnapshot:
    return "SNAPSHOT_ERROR";
  case ErrorKind::kConcurrentRun:
    return "CONCURRENT_RUN_ERROR";
  case ErrorKind::kQuarantine:
    return "QUARANTINE_ERROR";
  case ErrorKind::kIo:
    return "IO_ERROR";
  }
  return "UNKNOWN_ERROR";
}

struct PipelineError {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;

  bool Ok() const {
    return kind == ErrorKind::kNone;
  }

  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
  }

  void Set(ErrorKind new_kind, std::string new_message) {
    kind = new_kind;
    message = std::move(new_message);
  }
};

// Single-line form: "<STABLE_CODE>: <message>".
inline std::string FormatPipelineError(const PipelineError& error) {
  return std::string(ToStableErrorCode(error.kind)) + ": " + error.message;
}

} // namespace trendloop::core::errors
