#pragma once

#include "core/errors/pipeline_error.hpp"

#include <filesystem>
#include <string>

namespace trendloop::pipeline {

// Cross-process run lock: a file that records the owner's PID and is held
// with an exclusive `flock` for as long as the guard lives.
//
// Acquire fails with a concurrent-run error while another guard holds the
// file, or while the recorded process is still alive. A lock left behind by a
// dead process is taken over in place (never unlinked and recreated), and
// `ReclaimedStale()` reports it so the caller can log a warning.
// The lock file is removed when the guard is released or destroyed.
class RunLock {
public:
  RunLock() = default;
  ~RunLock();

  RunLock(const RunLock&) = delete;
  RunLock& operator=(const RunLock&) = delete;

  bool Acquire(const std::filesystem::path& lock_path, core::errors::PipelineError& error);
  void Release();

  bool Held() const;
  bool ReclaimedStale() const;
  const std::filesystem::path& Path() const;

private:
  std::filesystem::path path_;
  int fd_ = -1;
  bool held_ = false;
  bool reclaimed_stale_ = false;
};

} // namespace trendloop::pipeline
