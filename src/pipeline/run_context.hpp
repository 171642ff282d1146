#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace trendloop::pipeline {

// Writer name used for keys seeded by the orchestrator before any stage runs.
inline constexpr std::string_view kOrchestratorWriter = "orchestrator";

// Per-run key/value scratch space shared by stages in execution order.
//
// Contract:
// - values are only ever added or rewritten by the stage that first wrote
//   them; a later stage cannot clobber or delete an earlier stage's output.
// - there is no removal API.
// - the context lives for one run and is never persisted.
class RunContext {
public:
  RunContext() = default;
  explicit RunContext(std::string run_id);

  const std::string& RunId() const;

  // Name recorded as owner for subsequent `Put` calls. The orchestrator sets
  // this before invoking each stage.
  void SetActiveWriter(std::string writer);
  const std::string& ActiveWriter() const;

  // Adds `key` or rewrites a key the active writer already owns.
  bool Put(std::string_view key, std::string value, std::string& error);

  std::optional<std::string> Get(std::string_view key) const;
  bool Contains(std::string_view key) const;

  // Owner of `key`, or empty when absent.
  std::string OwnerOf(std::string_view key) const;

  std::map<std::string, std::string> Values() const;
  std::size_t Size() const;

private:
  struct Entry {
    std::string value;
    std::string writer;
  };

  std::string run_id_;
  std::string active_writer_ = std::string(kOrchestratorWriter);
  std::map<std::string, Entry, std::less<>> entries_;
};

// Renders the context as `key=value` lines for child processes. Newlines and
// backslashes inside values are escaped so every entry stays on one line.
std::string ToKeyValueText(const RunContext& context);

} // namespace trendloop::pipeline
