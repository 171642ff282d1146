#pragma once

#include "pipeline/stage.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace trendloop::pipeline {

// Monotonic time source. Injected so runtime-budget behavior is testable
// without sleeping.
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

SteadyClock DefaultSteadyClock();

// Limits that stop a run before it makes things worse.
struct SafetyPolicy {
  std::uint32_t max_consecutive_failures = 3;
  std::chrono::seconds max_runtime{600};
};

bool ValidateSafetyPolicy(const SafetyPolicy& policy, std::string& error);

enum class GuardDecision {
  kContinue,
  kAbortConsecutiveFailures,
  kAbortTimeout,
};

const char* ToString(GuardDecision decision);

struct SafetyState {
  std::uint32_t consecutive_failures = 0;
  std::uint32_t total_failures = 0;
  std::chrono::steady_clock::time_point run_started_at{};
};

// Tracks consecutive failures and elapsed runtime for one run.
//
// Rules:
// - failure increments the consecutive counter, success resets it, skipped
//   leaves it unchanged.
// - reaching `max_consecutive_failures` aborts the run.
// - the runtime budget is checked before each stage is started; a stage that
//   is already running is never interrupted.
class SafetyGuard {
public:
  explicit SafetyGuard(SafetyPolicy policy, SteadyClock clock = DefaultSteadyClock());

  GuardDecision RecordOutcome(const StageOutcome& outcome);

  // kAbortTimeout once elapsed time exceeds the runtime budget.
  GuardDecision CheckDeadline() const;

  std::chrono::steady_clock::duration Elapsed() const;
  const SafetyState& State() const;
  const SafetyPolicy& Policy() const;

private:
  SafetyPolicy policy_;
  SteadyClock clock_;
  SafetyState state_;
};

} // namespace trendloop::pipeline
