#include "pipeline/safety_guard.hpp"

#include <utility>

namespace trendloop::pipeline {

SteadyClock DefaultSteadyClock() {
  return [] { return std::chrono::steady_clock::now(); };
}

bool ValidateSafetyPolicy(const SafetyPolicy& policy, std::string& error) {
  if (policy.max_consecutive_failures < 1U) {
    error = "max_consecutive_failures must be at least 1";
    return false;
  }
  if (policy.max_runtime.count() <= 0) {
    error = "max_runtime must be greater than zero";
    return false;
  }
  return true;
}

const char* ToString(GuardDecision decision) {
  switch (decision) {
  case GuardDecision::kContinue:
    return "continue";
  case GuardDecision::kAbortConsecutiveFailures:
    return "abort_consecutive_failures";
  case GuardDecision::kAbortTimeout:
    return "abort_timeout";
  }
  return "continue";
}

SafetyGuard::SafetyGuard(SafetyPolicy policy, SteadyClock clock)
    : policy_(policy), clock_(clock ? std::move(clock) : DefaultSteadyClock()) {
  state_.run_started_at = clock_();
}

GuardDecision SafetyGuard::RecordOutcome(const StageOutcome& outcome) {
  switch (outcome.kind) {
  case OutcomeKind::kSuccess:
    state_.consecutive_failures = 0;
    break;
  case OutcomeKind::kFailure:
    ++state_.consecutive_failures;
    ++state_.total_failures;
    break;
  case OutcomeKind::kSkipped:
    break;
  }

  if (state_.consecutive_failures >= policy_.max_consecutive_failures) {
    return GuardDecision::kAbortConsecutiveFailures;
  }
  return GuardDecision::kContinue;
}

GuardDecision SafetyGuard::CheckDeadline() const {
  if (Elapsed() > policy_.max_runtime) {
    return GuardDecision::kAbortTimeout;
  }
  return GuardDecision::kContinue;
}

std::chrono::steady_clock::duration SafetyGuard::Elapsed() const {
  return clock_() - state_.run_started_at;
}

const SafetyState& SafetyGuard::State() const {
  return state_;
}

const SafetyPolicy& SafetyGuard::Policy() const {
  return policy_;
}

} // namespace trendloop::pipeline
