#include "pipeline/stage.hpp"

#include <utility>

namespace trendloop::pipeline {

const char* ToString(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::kSuccess:
    return "success";
  case OutcomeKind::kFailure:
    return "failure";
  case OutcomeKind::kSkipped:
    return "skipped";
  }
  return "failure";
}

bool ParseOutcomeKind(std::string_view text, OutcomeKind& kind) {
  if (text == "success") {
    kind = OutcomeKind::kSuccess;
    return true;
  }
  if (text == "failure") {
    kind = OutcomeKind::kFailure;
    return true;
  }
  if (text == "skipped") {
    kind = OutcomeKind::kSkipped;
    return true;
  }
  return false;
}

StageOutcome StageOutcome::Success(std::map<std::string, std::string> metadata) {
  StageOutcome outcome;
  outcome.kind = OutcomeKind::kSuccess;
  outcome.metadata = std::move(metadata);
  return outcome;
}

StageOutcome StageOutcome::Failure(std::string message, std::string error_class) {
  StageOutcome outcome;
  outcome.kind = OutcomeKind::kFailure;
  outcome.message = std::move(message);
  outcome.error_class = std::move(error_class);
  return outcome;
}

StageOutcome StageOutcome::Skipped(std::string reason) {
  StageOutcome outcome;
  outcome.kind = OutcomeKind::kSkipped;
  outcome.message = std::move(reason);
  return outcome;
}

FunctionStage::FunctionStage(Fn fn) : fn_(std::move(fn)) {}

StageOutcome FunctionStage::Execute(RunContext& context, const std::string& run_id) {
  if (!fn_) {
    return StageOutcome::Failure("stage callable is empty", "invocation_error");
  }
  return fn_(context, run_id);
}

} // namespace trendloop::pipeline
