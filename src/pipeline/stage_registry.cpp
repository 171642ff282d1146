#include "pipeline/stage_registry.hpp"

#include "pipeline/run_context.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace trendloop::pipeline {

using core::errors::ErrorKind;

bool StageRegistry::Register(StageDefinition stage, core::errors::PipelineError& error) {
  error.Clear();
  if (sealed_) {
    error.Set(ErrorKind::kConfiguration,
              "stage registry is sealed; cannot register '" + stage.name + "'");
    return false;
  }
  if (stage.name.empty()) {
    error.Set(ErrorKind::kConfiguration, "stage name cannot be empty");
    return false;
  }
  if (stage.name == kOrchestratorWriter) {
    error.Set(ErrorKind::kConfiguration,
              "stage name '" + stage.name + "' is reserved for the run orchestrator");
    return false;
  }
  if (!stage.capability) {
    error.Set(ErrorKind::kConfiguration, "stage '" + stage.name + "' has no capability");
    return false;
  }

  for (const StageDefinition& existing : stages_) {
    if (existing.name == stage.name) {
      error.Set(ErrorKind::kConfiguration, "duplicate stage name '" + stage.name + "'");
      return false;
    }
    if (existing.ordinal == stage.ordinal) {
      error.Set(ErrorKind::kConfiguration,
                "stage '" + stage.name + "' reuses ordinal " + std::to_string(stage.ordinal) +
                    " already taken by '" + existing.name + "'");
      return false;
    }
  }

  const auto insert_at =
      std::upper_bound(stages_.begin(), stages_.end(), stage.ordinal,
                       [](std::uint32_t ordinal, const StageDefinition& candidate) {
                         return ordinal < candidate.ordinal;
                       });
  stages_.insert(insert_at, std::move(stage));
  return true;
}

void StageRegistry::Seal() {
  sealed_ = true;
}

bool StageRegistry::IsSealed() const {
  return sealed_;
}

const std::vector<StageDefinition>& StageRegistry::OrderedStages() const {
  return stages_;
}

const StageDefinition* StageRegistry::Find(std::string_view name) const {
  const auto it = std::find_if(stages_.begin(), stages_.end(),
                               [name](const StageDefinition& stage) { return stage.name == name; });
  if (it == stages_.end()) {
    return nullptr;
  }
  return &(*it);
}

std::size_t StageRegistry::Size() const {
  return stages_.size();
}

} // namespace trendloop::pipeline
