#pragma once

// reclaim/lock.hpp - Cooperative single-instance lock per state directory.
//
// STATES:
//   unlocked --(O_CREAT|O_EXCL create)--> held
//   held --(release() or ~ProcessLock)--> unlocked
//
// On create conflict the owner record is read and its pid checked with
// kill(pid, 0). A dead owner (ESRCH, or a pid <= 0) is stale: the file is
// removed and the create retried exactly once, the new record marked
// recoveredFromStale. The liveness check and retry are best-effort; two processes
// recovering the same stale lock can still race, and the loser reports
// lock_held.
//
// The lock is advisory. Engines take `const ProcessLock&` so a caller cannot
// reach them without having acquired it.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "reclaim/types.hpp"

namespace reclaim {

struct LockInfo {
  int64_t pid{0};
  std::string mode;
  std::string hostname;
  uint64_t started_at_ms{0};
  bool recovered_from_stale{false};
  uint64_t recovered_at_ms{0};
  int64_t stale_lock_pid{0};
};

jsonlite::Object lock_info_to_object(const LockInfo& info);

std::string resolve_lock_path(const std::string& state_root);

// nullopt when the file is absent or not a JSON object.
std::optional<LockInfo> read_lock_info(const std::string& lock_path);

bool is_process_running(int64_t pid);

struct LockOptions {
  bool allow_stale_break{true};
};

struct LockAcquireResult;

LockAcquireResult acquire_lock(const std::string& state_root, const std::string& mode,
                               const LockOptions& options = {});

class ProcessLock {
 public:
  ~ProcessLock();
  ProcessLock(const ProcessLock&) = delete;
  ProcessLock& operator=(const ProcessLock&) = delete;

  // Removes the lock file. Idempotent.
  void release();

  bool held() const { return held_; }
  const std::string& path() const { return path_; }
  const LockInfo& info() const { return info_; }

 private:
  friend LockAcquireResult acquire_lock(const std::string&, const std::string&, const LockOptions&);
  ProcessLock(std::string path, LockInfo info) : path_(std::move(path)), info_(std::move(info)) {}

  std::string path_;
  LockInfo info_;
  bool held_{true};
};

struct LockAcquireResult {
  std::unique_ptr<ProcessLock> lock;
  ErrorCode error_code{ErrorCode::none};
  std::string message;
  std::string lock_path;
  std::optional<LockInfo> holder;
  bool holder_stale{false};

  bool ok() const { return lock != nullptr; }
};

// Removes the lock file regardless of owner. A missing file is success.
bool break_lock(const std::string& lock_path, std::string* error = nullptr);

// Human-readable "already running" description of a holder.
std::string describe_holder(const LockInfo& info, bool stale);

}  // namespace reclaim
