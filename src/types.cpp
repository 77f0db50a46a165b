#include "reclaim/types.hpp"

#include <chrono>

namespace reclaim {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::lock_held: return "lock_held";
    case ErrorCode::lock_not_held: return "lock_not_held";
    case ErrorCode::lock_io_error: return "lock_io_error";
    case ErrorCode::batch_not_found: return "batch_not_found";
  }
  return "unknown";
}

std::string to_string(AuditAction action) {
  switch (action) {
    case AuditAction::cleanup: return "cleanup";
    case AuditAction::restore: return "restore";
    case AuditAction::recycle_maintain: return "recycle_maintain";
    case AuditAction::unknown: return "unknown";
  }
  return "unknown";
}

AuditAction audit_action_from_string(const std::string& s) {
  if (s == "cleanup") return AuditAction::cleanup;
  if (s == "restore") return AuditAction::restore;
  if (s == "recycle_maintain") return AuditAction::recycle_maintain;
  return AuditAction::unknown;
}

uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

// ---------------------------------------------------------------------------
// AuditRecord <-> JSON
// ---------------------------------------------------------------------------

namespace {

constexpr const char* kCoreKeys[] = {
    "action", "time", "scope", "batchId", "sourcePath", "recyclePath",
    "status", "error", "error_type", "sizeBytes", "dryRun",
};

bool is_core_key(const std::string& key) {
  for (const char* k : kCoreKeys) {
    if (key == k) return true;
  }
  return false;
}

}  // namespace

jsonlite::Object audit_record_to_object(const AuditRecord& r) {
  jsonlite::Object o = r.extra;
  o["action"] = jsonlite::Value{r.action == AuditAction::unknown && !r.action_text.empty()
                                    ? r.action_text
                                    : to_string(r.action)};
  o["time"] = jsonlite::Value{r.time_ms};
  if (!r.scope.empty()) o["scope"] = jsonlite::Value{r.scope};
  if (!r.batch_id.empty()) o["batchId"] = jsonlite::Value{r.batch_id};
  if (r.action != AuditAction::recycle_maintain) {
    o["sourcePath"] = jsonlite::Value{r.source_path};
    o["recyclePath"] = r.recycle_path ? jsonlite::Value{*r.recycle_path} : jsonlite::Value{nullptr};
    o["sizeBytes"] = jsonlite::Value{r.size_bytes};
  }
  o["status"] = jsonlite::Value{r.status};
  if (!r.error.empty()) o["error"] = jsonlite::Value{r.error};
  o["error_type"] = r.error_type.empty() ? jsonlite::Value{nullptr} : jsonlite::Value{r.error_type};
  o["dryRun"] = jsonlite::Value{r.dry_run};
  return o;
}

AuditRecord audit_record_from_object(const jsonlite::Object& obj) {
  AuditRecord r;
  r.action_text = jsonlite::get_string(obj, "action");
  r.action = audit_action_from_string(r.action_text);
  r.time_ms = jsonlite::get_u64(obj, "time");
  r.scope = jsonlite::get_string(obj, "scope");
  r.batch_id = jsonlite::get_string(obj, "batchId");
  r.source_path = jsonlite::get_string(obj, "sourcePath");
  if (jsonlite::has_string(obj, "recyclePath")) {
    r.recycle_path = jsonlite::get_string(obj, "recyclePath");
  }
  r.status = jsonlite::get_string(obj, "status");
  r.error = jsonlite::get_string(obj, "error");
  r.error_type = jsonlite::get_string(obj, "error_type");
  r.size_bytes = jsonlite::get_u64(obj, "sizeBytes");
  r.dry_run = jsonlite::get_bool(obj, "dryRun");
  for (const auto& [k, v] : obj) {
    if (!is_core_key(k)) r.extra[k] = v;
  }
  return r;
}

// ---------------------------------------------------------------------------
// CleanupTarget / Batch
// ---------------------------------------------------------------------------

std::optional<CleanupTarget> cleanup_target_from_object(const jsonlite::Object& obj) {
  if (!jsonlite::has_string(obj, "path")) return std::nullopt;
  CleanupTarget t;
  t.path = jsonlite::get_string(obj, "path");
  if (t.path.empty()) return std::nullopt;
  t.size_bytes = jsonlite::get_u64(obj, "sizeBytes");
  for (const auto& [k, v] : obj) {
    if (k != "path" && k != "sizeBytes") t.metadata[k] = v;
  }
  return t;
}

jsonlite::Object batch_to_object(const Batch& b, bool include_entries) {
  jsonlite::Object o;
  o["batchId"] = jsonlite::Value{b.batch_id};
  o["firstTime"] = jsonlite::Value{b.first_time_ms};
  o["totalBytes"] = jsonlite::Value{b.total_bytes};
  o["entryCount"] = jsonlite::Value{static_cast<std::uint64_t>(b.entries.size())};
  if (include_entries) {
    jsonlite::Array entries;
    for (const auto& e : b.entries) entries.push_back(jsonlite::Value{audit_record_to_object(e)});
    o["entries"] = jsonlite::Value{std::move(entries)};
  }
  return o;
}

}  // namespace reclaim
