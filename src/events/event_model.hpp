#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace trendloop::events {

// Run timeline categories written to `events.jsonl`. Names are part of the
// on-disk contract; add new values instead of renaming existing ones.
enum class EventType {
  kRunStarted,
  kRunRejected,
  kSnapshotCreated,
  kStageStarted,
  kStageFinished,
  kRunFinished,
  kSnapshotRestored,
  kItemQuarantined,
  kInfo,
  kWarning,
  kError,
};

struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kInfo;
  std::map<std::string, std::string> payload;
};

std::string_view ToString(EventType event_type);
std::string ToJson(const Event& event);

} // namespace trendloop::events
