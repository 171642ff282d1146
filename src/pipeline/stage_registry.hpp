#pragma once

#include "core/errors/pipeline_error.hpp"
#include "pipeline/stage.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace trendloop::pipeline {

// Ordered, immutable-after-seal list of pipeline stages.
//
// Contract:
// - stage names and ordinals are unique.
// - `OrderedStages()` is sorted by ascending ordinal regardless of the order
//   stages were registered in.
// - once sealed, further registration is rejected with a configuration error.
class StageRegistry {
public:
  bool Register(StageDefinition stage, core::errors::PipelineError& error);

  void Seal();
  bool IsSealed() const;

  const std::vector<StageDefinition>& OrderedStages() const;
  const StageDefinition* Find(std::string_view name) const;
  std::size_t Size() const;

private:
  std::vector<StageDefinition> stages_;
  bool sealed_ = false;
};

} // namespace trendloop::pipeline
