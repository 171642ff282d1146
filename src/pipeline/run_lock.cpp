#include "pipeline/run_lock.hpp"

#include "core/fs_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string_view>

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace trendloop::pipeline {

using core::errors::ErrorKind;

namespace {

// Attempts before giving up when the lock file is swapped under us.
constexpr int kAcquireAttempts = 3;

bool IsProcessAlive(long pid) {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  // EPERM: the process exists but belongs to someone else.
  return errno == EPERM;
}

std::string ErrnoText(int err) {
  return std::strerror(err);
}

bool ReadFdText(int fd, std::string& text) {
  text.clear();
  char buffer[64];
  off_t offset = 0;
  while (true) {
    const ssize_t n = ::pread(fd, buffer, sizeof(buffer), offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    if (n == 0) {
      return true;
    }
    text.append(buffer, static_cast<std::size_t>(n));
    offset += n;
  }
}

// Parses "<pid>\n". Returns false for anything else.
bool ParsePid(const std::string& text, long& pid) {
  char* end = nullptr;
  pid = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str()) {
    return false;
  }
  for (; *end != '\0'; ++end) {
    if (*end != '\n' && *end != '\r' && *end != ' ') {
      return false;
    }
  }
  return pid > 0;
}

// The holder unlinks the file on release while still holding the flock, so
// a lock won on an inode that is no longer at `path` is worthless.
bool StillLinkedAt(int fd, const fs::path& path) {
  struct stat opened {};
  struct stat linked {};
  if (::fstat(fd, &opened) != 0 || ::stat(path.c_str(), &linked) != 0) {
    return false;
  }
  return opened.st_dev == linked.st_dev && opened.st_ino == linked.st_ino;
}

bool WritePid(int fd, std::string& error) {
  if (::ftruncate(fd, 0) != 0) {
    error = ErrnoText(errno);
    return false;
  }
  const std::string pid_text = std::to_string(static_cast<long>(::getpid())) + "\n";
  const ssize_t written = ::pwrite(fd, pid_text.data(), pid_text.size(), 0);
  if (written != static_cast<ssize_t>(pid_text.size())) {
    error = written < 0 ? ErrnoText(errno) : "short write";
    return false;
  }
  return true;
}

std::string ConflictMessage(const fs::path& path, std::string_view detail) {
  return "another trendloop run appears active (" + std::string(detail) +
         "); lock file: " + path.string();
}

} // namespace

RunLock::~RunLock() {
  Release();
}

bool RunLock::Acquire(const fs::path& lock_path, core::errors::PipelineError& error) {
  error.Clear();
  if (held_) {
    error.Set(ErrorKind::kConcurrentRun, ConflictMessage(path_, "lock already held by this guard"));
    return false;
  }

  std::string io_error;
  if (!core::EnsureParentDirectory(lock_path, io_error)) {
    error.Set(ErrorKind::kIo, io_error);
    return false;
  }

  reclaimed_stale_ = false;
  for (int attempt = 0; attempt < kAcquireAttempts; ++attempt) {
    const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      error.Set(ErrorKind::kIo,
                "failed to open lock file '" + lock_path.string() + "': " + ErrnoText(errno));
      return false;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      const int flock_errno = errno;
      std::string text;
      long owner_pid = 0;
      const bool has_pid = ReadFdText(fd, text) && ParsePid(text, owner_pid);
      ::close(fd);
      if (flock_errno == EWOULDBLOCK) {
        error.Set(ErrorKind::kConcurrentRun,
                  ConflictMessage(lock_path, has_pid ? "pid " + std::to_string(owner_pid)
                                                     : std::string("lock is held")));
      } else {
        error.Set(ErrorKind::kIo,
                  "failed to lock '" + lock_path.string() + "': " + ErrnoText(flock_errno));
      }
      return false;
    }

    if (!StillLinkedAt(fd, lock_path)) {
      ::close(fd);
      continue;
    }

    // We hold the flock. Any PID left in the file belongs to a previous owner.
    std::string text;
    if (!ReadFdText(fd, text)) {
      const int read_errno = errno;
      ::close(fd);
      error.Set(ErrorKind::kIo,
                "failed to read lock file '" + lock_path.string() + "': " + ErrnoText(read_errno));
      return false;
    }
    if (!text.empty()) {
      long owner_pid = 0;
      if (!ParsePid(text, owner_pid)) {
        ::close(fd);
        error.Set(ErrorKind::kConcurrentRun,
                  ConflictMessage(lock_path, "lock file has no readable pid; remove it if no run "
                                             "is active"));
        return false;
      }
      if (IsProcessAlive(owner_pid)) {
        ::close(fd);
        error.Set(ErrorKind::kConcurrentRun,
                  ConflictMessage(lock_path, "pid " + std::to_string(owner_pid)));
        return false;
      }
      reclaimed_stale_ = true;
    }

    std::string write_error;
    if (!WritePid(fd, write_error)) {
      ::close(fd);
      error.Set(ErrorKind::kIo,
                "failed to write lock file '" + lock_path.string() + "': " + write_error);
      return false;
    }

    fd_ = fd;
    path_ = lock_path;
    held_ = true;
    return true;
  }

  error.Set(ErrorKind::kConcurrentRun, ConflictMessage(lock_path, "lock was re-acquired by "
                                                                  "another process"));
  return false;
}

void RunLock::Release() {
  if (!held_) {
    return;
  }
  held_ = false;
  // Unlink before dropping the flock so a waiter can never win a dead inode
  // that is still linked.
  if (StillLinkedAt(fd_, path_)) {
    ::unlink(path_.c_str());
  }
  ::close(fd_);
  fd_ = -1;
}

bool RunLock::Held() const {
  return held_;
}

bool RunLock::ReclaimedStale() const {
  return reclaimed_stale_;
}

const fs::path& RunLock::Path() const {
  return path_;
}

} // namespace trendloop::pipeline
