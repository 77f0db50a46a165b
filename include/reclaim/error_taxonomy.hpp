#pragma once

// reclaim/error_taxonomy.hpp - Classification of per-item failures.
//
// Classification is derived from error text only and is used for audit and
// reporting. It never changes control flow.

#include <string>
#include <string_view>
#include <system_error>

namespace reclaim {

enum class ErrorKind {
  permission_denied,
  path_not_found,
  path_validation_failed,
  dir_not_empty,
  timeout,
  disk_full,
  read_only,
  conflict,
  policy_skipped,
  unknown,
};

std::string to_string(ErrorKind kind);

// Unrecognized strings map to unknown.
ErrorKind error_kind_from_string(std::string_view s);

// Case-insensitive substring match, first rule wins:
//   permission -> not found -> validation -> not empty -> timeout
//   -> disk full -> read only -> unknown
ErrorKind classify_error(std::string_view message);

// Classifies a filesystem failure from its errno symbol and strerror text
// only. describe_fs_error() output also embeds the path, which must not
// influence the kind.
ErrorKind classify_fs_error(const std::error_code& ec);

std::string error_kind_label(ErrorKind kind);

// Symbolic errno name ("ENOENT"), or "E<number>" when not in the table.
std::string errno_name(int err);

// "<op> '<path>': <strerror> [<ERRNO>]"
std::string describe_fs_error(std::string_view op, const std::string& path, const std::error_code& ec);

}  // namespace reclaim
