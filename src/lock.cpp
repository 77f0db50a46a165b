#include "reclaim/lock.hpp"

#include "reclaim/error_taxonomy.hpp"
#include "reclaim/fsutil.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace reclaim {

namespace {

constexpr const char* kLockFileName = ".lockfile";

enum class CreateOutcome { created, exists, io_error };

CreateOutcome create_exclusive(const std::string& path, const std::string& payload, std::string* error) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST) return CreateOutcome::exists;
    *error = describe_fs_error("create lock", path, std::error_code(errno, std::generic_category()));
    return CreateOutcome::io_error;
  }
  ssize_t n;
  do {
    n = ::write(fd, payload.data(), payload.size());
  } while (n < 0 && errno == EINTR);
  int err = 0;
  if (n != static_cast<ssize_t>(payload.size())) {
    err = n < 0 ? errno : EIO;
  } else if (::fsync(fd) != 0) {
    err = errno;
  }
  ::close(fd);
  if (err != 0) {
    *error = describe_fs_error("write lock", path, std::error_code(err, std::generic_category()));
    ::unlink(path.c_str());
    return CreateOutcome::io_error;
  }
  return CreateOutcome::created;
}

}  // namespace

// ---------------------------------------------------------------------------
// LockInfo <-> JSON
// ---------------------------------------------------------------------------

jsonlite::Object lock_info_to_object(const LockInfo& info) {
  jsonlite::Object o;
  o["pid"] = info.pid < 0 ? jsonlite::Value{static_cast<double>(info.pid)}
                          : jsonlite::Value{static_cast<std::uint64_t>(info.pid)};
  o["mode"] = jsonlite::Value{info.mode};
  o["hostname"] = jsonlite::Value{info.hostname};
  o["startedAt"] = jsonlite::Value{info.started_at_ms};
  if (info.recovered_from_stale) {
    o["recoveredFromStale"] = jsonlite::Value{true};
    o["recoveredAt"] = jsonlite::Value{info.recovered_at_ms};
    o["staleLockPid"] = info.stale_lock_pid > 0
                            ? jsonlite::Value{static_cast<std::uint64_t>(info.stale_lock_pid)}
                            : jsonlite::Value{nullptr};
  }
  return o;
}

namespace {

LockInfo lock_info_from_object(const jsonlite::Object& obj) {
  LockInfo info;
  info.pid = jsonlite::get_i64(obj, "pid");
  info.mode = jsonlite::get_string(obj, "mode", "unknown");
  info.hostname = jsonlite::get_string(obj, "hostname");
  info.started_at_ms = jsonlite::get_u64(obj, "startedAt");
  info.recovered_from_stale = jsonlite::get_bool(obj, "recoveredFromStale");
  info.recovered_at_ms = jsonlite::get_u64(obj, "recoveredAt");
  info.stale_lock_pid = jsonlite::get_i64(obj, "staleLockPid");
  return info;
}

}  // namespace

std::string resolve_lock_path(const std::string& state_root) {
  std::error_code ec;
  fs::path root = fs::absolute(fs::path(state_root.empty() ? "." : state_root), ec);
  if (ec) root = fs::path(state_root);
  return (root / kLockFileName).lexically_normal().string();
}

std::optional<LockInfo> read_lock_info(const std::string& lock_path) {
  const auto raw = read_file(lock_path);
  if (!raw) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(*raw, &err);
  if (err) return std::nullopt;
  return lock_info_from_object(obj);
}

bool is_process_running(int64_t pid) {
  if (pid <= 0) return false;
  if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
  // EPERM: the process exists but belongs to someone else.
  return errno != ESRCH;
}

std::string describe_holder(const LockInfo& info, bool stale) {
  std::string out = stale ? "stale lock left by pid " : "another instance is already running: pid ";
  out += std::to_string(info.pid);
  if (!info.mode.empty()) out += ", mode " + info.mode;
  if (!info.hostname.empty()) out += ", host " + info.hostname;
  if (info.started_at_ms > 0) out += ", started at " + std::to_string(info.started_at_ms);
  return out;
}

// ---------------------------------------------------------------------------
// ProcessLock
// ---------------------------------------------------------------------------

ProcessLock::~ProcessLock() {
  release();
}

void ProcessLock::release() {
  if (!held_) return;
  held_ = false;
  std::error_code ec;
  fs::remove(path_, ec);
}

LockAcquireResult acquire_lock(const std::string& state_root, const std::string& mode,
                               const LockOptions& options) {
  LockAcquireResult result;
  result.lock_path = resolve_lock_path(state_root);

  const FsStatus dir = ensure_dir(fs::path(result.lock_path).parent_path());
  if (!dir.ok) {
    result.error_code = ErrorCode::lock_io_error;
    result.message = dir.message;
    return result;
  }

  LockInfo base;
  base.pid = current_pid();
  base.mode = mode.empty() ? "unknown" : mode;
  base.hostname = get_hostname();
  base.started_at_ms = now_unix_ms();

  std::optional<LockInfo> stale_info;
  bool recovered = false;

  // Two attempts: the original create and at most one retry after removing a
  // stale lock.
  for (int attempt = 0; attempt < 2; ++attempt) {
    LockInfo payload = base;
    if (recovered) {
      payload.recovered_from_stale = true;
      payload.recovered_at_ms = now_unix_ms();
      payload.stale_lock_pid = stale_info ? stale_info->pid : 0;
    }

    std::string io_error;
    const CreateOutcome outcome = create_exclusive(
        result.lock_path, jsonlite::serialize(lock_info_to_object(payload)) + "\n", &io_error);
    if (outcome == CreateOutcome::created) {
      result.lock.reset(new ProcessLock(result.lock_path, payload));
      return result;
    }
    if (outcome == CreateOutcome::io_error) {
      result.error_code = ErrorCode::lock_io_error;
      result.message = io_error;
      return result;
    }

    const auto holder = read_lock_info(result.lock_path);
    const bool stale = !is_process_running(holder ? holder->pid : 0);
    if (stale && options.allow_stale_break && attempt == 0) {
      stale_info = holder;
      recovered = true;
      std::error_code ec;
      fs::remove(result.lock_path, ec);
      continue;
    }

    result.error_code = ErrorCode::lock_held;
    result.holder = holder;
    result.holder_stale = stale;
    result.message = holder ? describe_holder(*holder, stale)
                            : std::string("lock file exists but is unreadable: ") + result.lock_path;
    return result;
  }

  result.error_code = ErrorCode::lock_held;
  result.holder = stale_info;
  result.holder_stale = stale_info.has_value();
  result.message = "lock file conflict persisted after stale lock recovery";
  return result;
}

bool break_lock(const std::string& lock_path, std::string* error) {
  std::error_code ec;
  fs::remove(lock_path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    if (error) *error = describe_fs_error("remove lock", lock_path, ec);
    return false;
  }
  return true;
}

}  // namespace reclaim
