#include "reclaim/error_taxonomy.hpp"

#include <cctype>
#include <cerrno>
#include <initializer_list>

namespace reclaim {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
  for (const char* n : needles) {
    if (text.find(n) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::permission_denied: return "permission_denied";
    case ErrorKind::path_not_found: return "path_not_found";
    case ErrorKind::path_validation_failed: return "path_validation_failed";
    case ErrorKind::dir_not_empty: return "dir_not_empty";
    case ErrorKind::timeout: return "timeout";
    case ErrorKind::disk_full: return "disk_full";
    case ErrorKind::read_only: return "read_only";
    case ErrorKind::conflict: return "conflict";
    case ErrorKind::policy_skipped: return "policy_skipped";
    case ErrorKind::unknown: return "unknown";
  }
  return "unknown";
}

ErrorKind error_kind_from_string(std::string_view s) {
  for (ErrorKind k : {ErrorKind::permission_denied, ErrorKind::path_not_found,
                      ErrorKind::path_validation_failed, ErrorKind::dir_not_empty,
                      ErrorKind::timeout, ErrorKind::disk_full, ErrorKind::read_only,
                      ErrorKind::conflict, ErrorKind::policy_skipped}) {
    if (s == to_string(k)) return k;
  }
  return ErrorKind::unknown;
}

ErrorKind classify_error(std::string_view message) {
  const std::string text = lower(message);
  if (text.empty()) return ErrorKind::unknown;
  if (contains_any(text, {"eacces", "eperm", "operation not permitted", "permission denied"})) {
    return ErrorKind::permission_denied;
  }
  if (contains_any(text, {"enoent", "enotdir", "not found", "no such file"})) {
    return ErrorKind::path_not_found;
  }
  if (contains_any(text, {"invalid", "illegal", "outside", "escape"})) {
    return ErrorKind::path_validation_failed;
  }
  if (contains_any(text, {"enotempty", "directory not empty"})) {
    return ErrorKind::dir_not_empty;
  }
  if (contains_any(text, {"timeout", "timed out", "etimedout"})) {
    return ErrorKind::timeout;
  }
  if (contains_any(text, {"enospc", "no space"})) {
    return ErrorKind::disk_full;
  }
  if (contains_any(text, {"read-only", "readonly", "erofs"})) {
    return ErrorKind::read_only;
  }
  return ErrorKind::unknown;
}

ErrorKind classify_fs_error(const std::error_code& ec) {
  if (!ec) return ErrorKind::unknown;
  if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
    return classify_error(errno_name(ec.value()) + ": " + ec.message());
  }
  return classify_error(ec.message());
}

std::string error_kind_label(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::permission_denied: return "Permission denied";
    case ErrorKind::path_not_found: return "Path not found";
    case ErrorKind::path_validation_failed: return "Path validation failed";
    case ErrorKind::dir_not_empty: return "Directory not empty";
    case ErrorKind::timeout: return "Timed out";
    case ErrorKind::disk_full: return "Disk full";
    case ErrorKind::read_only: return "Read-only location";
    case ErrorKind::conflict: return "Path conflict";
    case ErrorKind::policy_skipped: return "Skipped by policy";
    case ErrorKind::unknown: return "Other error";
  }
  return "Other error";
}

std::string errno_name(int err) {
  switch (err) {
    case EPERM: return "EPERM";
    case ENOENT: return "ENOENT";
    case EIO: return "EIO";
    case EACCES: return "EACCES";
    case EBUSY: return "EBUSY";
    case EEXIST: return "EEXIST";
    case EXDEV: return "EXDEV";
    case ENOTDIR: return "ENOTDIR";
    case EISDIR: return "EISDIR";
    case EINVAL: return "EINVAL";
    case ENOSPC: return "ENOSPC";
    case EROFS: return "EROFS";
    case ENAMETOOLONG: return "ENAMETOOLONG";
    case ENOTEMPTY: return "ENOTEMPTY";
    case ELOOP: return "ELOOP";
    case ETIMEDOUT: return "ETIMEDOUT";
    case EDQUOT: return "EDQUOT";
    default: return "E" + std::to_string(err);
  }
}

std::string describe_fs_error(std::string_view op, const std::string& path, const std::error_code& ec) {
  std::string out(op);
  out += " '";
  out += path;
  out += "': ";
  out += ec.message();
  if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
    out += " [";
    out += errno_name(ec.value());
    out += "]";
  }
  return out;
}

}  // namespace reclaim
