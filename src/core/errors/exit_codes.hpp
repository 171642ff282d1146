#pragma once

namespace trendloop::core::errors {

// Stable process-exit contract consumed by the scheduler that triggers runs.
//
// The first three values keep conventional meanings used by scripts:
// - 0 success / run completed
// - 1 generic command failure
// - 2 usage/argument failure
//
// The remaining values map one-to-one onto run verdicts so a periodic trigger
// can decide alerting without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kSnapshotFailed = 20,
  kSafetyAbort = 30,
  kTimeoutAbort = 31,
  kConcurrentRun = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace trendloop::core::errors
