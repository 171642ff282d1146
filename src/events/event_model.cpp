#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace trendloop::events {

std::string_view ToString(EventType event_type) {
  switch (event_type) {
  case EventType::kRunStarted:
    return "RUN_STARTED";
  case EventType::kRunRejected:
    return "RUN_REJECTED";
  case EventType::kSnapshotCreated:
    return "SNAPSHOT_CREATED";
  case EventType::kStageStarted:
    return "STAGE_STARTED";
  case EventType::kStageFinished:
    return "STAGE_FINISHED";
  case EventType::kRunFinished:
    return "RUN_FINISHED";
  case EventType::kSnapshotRestored:
    return "SNAPSHOT_RESTORED";
  case EventType::kItemQuarantined:
    return "ITEM_QUARANTINED";
  case EventType::kInfo:
    return "INFO";
  case EventType::kWarning:
    return "WARNING";
  case EventType::kError:
    return "ERROR";
  }
  return "UNKNOWN";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{\"ts_utc\":" << core::JsonString(core::FormatUtcTimestamp(event.ts))
      << ",\"type\":" << core::JsonString(ToString(event.type))
      << ",\"payload\":" << core::JsonStringMap(event.payload) << "}";
  return out.str();
}

} // namespace trendloop::events
