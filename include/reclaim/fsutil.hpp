#pragma once

// reclaim/fsutil.hpp - Filesystem primitives shared by the engines.
//
// Every function here uses the std::error_code overloads of std::filesystem
// and reports failure through FsStatus. Nothing throws.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace reclaim {

struct FsStatus {
  bool ok{true};
  std::error_code ec;
  std::string message;   // describe_fs_error() text, empty on success
};

// True if anything (including a dangling symlink) exists at p.
bool path_exists(const std::filesystem::path& p);

// Create parent directories, then rename. On EXDEV fall back to
// copy_then_remove(). The fallback is not crash-atomic: a crash between the
// copy and the removal leaves both copies on disk.
FsStatus move_path(const std::filesystem::path& src, const std::filesystem::path& dest);

// Recursive copy (symlinks copied as links) followed by recursive removal of src.
FsStatus copy_then_remove(const std::filesystem::path& src, const std::filesystem::path& dest);

// Recursive remove. A missing path is not an error.
FsStatus remove_path(const std::filesystem::path& p);

FsStatus ensure_dir(const std::filesystem::path& p);

// Sum of regular file sizes under p. Symlinks are not followed; unreadable
// entries are skipped. A missing path is 0.
uint64_t directory_size(const std::filesystem::path& p);

std::optional<std::string> read_file(const std::filesystem::path& p);

std::string get_hostname();
int64_t current_pid();

// Expand a leading "~/" against $HOME.
std::string expand_home(const std::string& p);

}  // namespace reclaim
