#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace trendloop::events {

// Appends one JSON-serialized event per line to `<output_dir>/events.jsonl`.
//
// Contract:
// - creates `output_dir` if needed.
// - writes exactly one line per call.
// - returns false with `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

} // namespace trendloop::events
