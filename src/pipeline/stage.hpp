#pragma once

#include "pipeline/run_context.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace trendloop::pipeline {

enum class OutcomeKind {
  kSuccess,
  kFailure,
  kSkipped,
};

const char* ToString(OutcomeKind kind);
bool ParseOutcomeKind(std::string_view text, OutcomeKind& kind);

// Failure classification assigned by the orchestrator when a stage throws.
inline constexpr std::string_view kUnhandledExceptionClass = "unhandled_exception";
// Classification recorded on stages that never ran because the run aborted.
inline constexpr std::string_view kNotStartedClass = "not_started";

// Result of one stage invocation.
//
// - success: optional metadata produced by the stage.
// - failure: human-readable message plus a stage-defined classification.
// - skipped: reason text. Skipped is neutral for safety accounting.
struct StageOutcome {
  OutcomeKind kind = OutcomeKind::kSuccess;
  std::string message;
  std::string error_class;
  std::map<std::string, std::string> metadata;

  bool IsSuccess() const {
    return kind == OutcomeKind::kSuccess;
  }
  bool IsFailure() const {
    return kind == OutcomeKind::kFailure;
  }
  bool IsSkipped() const {
    return kind == OutcomeKind::kSkipped;
  }

  static StageOutcome Success(std::map<std::string, std::string> metadata = {});
  static StageOutcome Failure(std::string message, std::string error_class = "stage_error");
  static StageOutcome Skipped(std::string reason);
};

// Capability the orchestrator invokes for one pipeline step. Implementations
// may read and extend the run context; they report failure through the
// returned outcome. Exceptions escaping `Execute` are converted into failures
// by the orchestrator.
class IStage {
public:
  virtual ~IStage() = default;

  virtual StageOutcome Execute(RunContext& context, const std::string& run_id) = 0;
};

// Adapts a callable to IStage. Used by embedders and tests that want to wire a
// stage without declaring a class.
class FunctionStage final : public IStage {
public:
  using Fn = std::function<StageOutcome(RunContext&, const std::string&)>;

  explicit FunctionStage(Fn fn);

  StageOutcome Execute(RunContext& context, const std::string& run_id) override;

private:
  Fn fn_;
};

// Declarative registry entry. The ordinal defines execution order.
struct StageDefinition {
  std::string name;
  std::uint32_t ordinal = 0;
  std::string description;
  std::shared_ptr<IStage> capability;
};

} // namespace trendloop::pipeline
