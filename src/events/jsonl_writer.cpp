#include "events/jsonl_writer.hpp"

#include "artifacts/output_dir_utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace trendloop::events {

bool AppendEventJsonl(const Event& event, const fs::path& output_dir, fs::path& written_path,
                      std::string& error) {
  if (!artifacts::EnsureOutputDir(output_dir, error)) {
    return false;
  }

  written_path = output_dir / "events.jsonl";
  std::ofstream out_file(written_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + written_path.string() + "' for append";
    return false;
  }

  // One line per event; the file is flushed per call so a crash loses at most
  // the event being written.
  out_file << ToJson(event) << '\n';
  out_file.flush();
  if (!out_file) {
    error = "failed while writing event log '" + written_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace trendloop::events
