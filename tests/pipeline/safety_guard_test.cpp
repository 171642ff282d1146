#include "../common/pipeline_fixtures.hpp"
#include "pipeline/safety_guard.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using trendloop::pipeline::GuardDecision;
using trendloop::pipeline::SafetyGuard;
using trendloop::pipeline::SafetyPolicy;
using trendloop::pipeline::StageOutcome;

namespace {

SafetyPolicy PolicyWithLimit(std::uint32_t limit) {
  SafetyPolicy policy;
  policy.max_consecutive_failures = limit;
  policy.max_runtime = std::chrono::seconds(600);
  return policy;
}

} // namespace

TEST_CASE("k consecutive failures trip the guard", "[pipeline][safety]") {
  trendloop::tests::common::FakeSteadyClock clock;
  SafetyGuard guard(PolicyWithLimit(3), clock.AsFunction());

  REQUIRE(guard.RecordOutcome(StageOutcome::Failure("boom")) == GuardDecision::kContinue);
  REQUIRE(guard.RecordOutcome(StageOutcome::Failure("boom")) == GuardDecision::kContinue);
  REQUIRE(guard.RecordOutcome(StageOutcome::Failure("boom")) ==
          GuardDecision::kAbortConsecutiveFailures);
  REQUIRE(guard.State().consecutive_failures == 3U);
}

TEST_CASE("A success resets the failure streak", "[pipeline][safety]") {
  trendloop::tests::common::FakeSteadyClock clock;
  SafetyGuard guard(PolicyWithLimit(3), clock.AsFunction());

  REQUIRE(guard.RecordOutcome(StageOutcome::Failure("a")) == GuardDecision::kContinue);
  REQUIRE(guard.RecordOutcome(StageOutcome::Success()) == GuardDecision::kContinue);
  REQUIRE(guard.State().consecutive_failures == 0U);
  REQUIRE(guard.RecordOutcome(StageOutcome::Failure("b")) == GuardDecision::kContinue);
  REQUIRE(guard.RecordOutcome(StageOutcome::Failure("c")) == GuardDecision::kContinue);
  REQUIRE(guard.State().consecutive_failures == 2U);
  REQUIRE(guard.State().total_failures == 3U);
}

TEST_CASE("Skipped outcomes leave the streak unchanged", "[pipeline][safety]") {
  trendloop::tests::common::FakeSteadyClock clock;
  SafetyGuard guard(PolicyWithLimit(2), clock.AsFunction());

  REQUIRE(guard.RecordOutcome(StageOutcome::Failure("a")) == GuardDecision::kContinue);
  REQUIRE(guard.RecordOutcome(StageOutcome::Skipped("nothing new")) == GuardDecision::kContinue);
  REQUIRE(guard.State().consecutive_failures == 1U);
  REQUIRE(guard.RecordOutcome(StageOutcome::Failure("b")) ==
          GuardDecision::kAbortConsecutiveFailures);
}

TEST_CASE("Deadline triggers only once elapsed time exceeds the budget", "[pipeline][safety]") {
  trendloop::tests::common::FakeSteadyClock clock;
  SafetyGuard guard(PolicyWithLimit(3), clock.AsFunction());

  REQUIRE(guard.CheckDeadline() == GuardDecision::kContinue);
  clock.Advance(std::chrono::seconds(600));
  REQUIRE(guard.CheckDeadline() == GuardDecision::kContinue);
  clock.Advance(std::chrono::milliseconds(1));
  REQUIRE(guard.CheckDeadline() == GuardDecision::kAbortTimeout);
  REQUIRE(guard.Elapsed() > std::chrono::seconds(600));
}

TEST_CASE("Safety policy validation rejects degenerate limits", "[pipeline][safety]") {
  std::string error;
  REQUIRE(trendloop::pipeline::ValidateSafetyPolicy(SafetyPolicy{}, error));

  SafetyPolicy zero_failures;
  zero_failures.max_consecutive_failures = 0;
  REQUIRE_FALSE(trendloop::pipeline::ValidateSafetyPolicy(zero_failures, error));
  REQUIRE(error.find("max_consecutive_failures") != std::string::npos);

  SafetyPolicy zero_runtime;
  zero_runtime.max_runtime = std::chrono::seconds(0);
  REQUIRE_FALSE(trendloop::pipeline::ValidateSafetyPolicy(zero_runtime, error));
}
