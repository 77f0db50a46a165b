#pragma once

// reclaim/types.hpp - Core data model shared by every engine.
//
// STATE MODEL:
//   - The audit log plus the recycle directory tree are the only durable state.
//   - Batch is derived: list_restorable_batches() rebuilds it from the log on
//     every call. Nothing in this file is ever persisted on its own.
//
// MEMORY OWNERSHIP:
//   - All members are value-owned. Engines return summaries by value.
//
// RECORD SCHEMA:
//   AuditRecord is a fixed core plus an open `extra` object. Unknown keys read
//   from the log land in `extra` and are written back untouched, so records
//   produced by other tools or newer builds survive a round trip.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "reclaim/jsonlite.hpp"

namespace reclaim {

// Engine-level failures that abort a whole invocation. Per-item failures are
// never reported here; they are classified with ErrorKind (error_taxonomy.hpp).
enum class ErrorCode {
  none,
  json_parse_error,
  config_invalid,
  lock_held,
  lock_not_held,
  lock_io_error,
  batch_not_found,
};

std::string to_string(ErrorCode code);

enum class AuditAction {
  cleanup,
  restore,
  recycle_maintain,
  unknown,
};

std::string to_string(AuditAction action);
AuditAction audit_action_from_string(const std::string& s);

// Outcome strings written to the "status" field.
namespace status {
inline constexpr const char* kSuccess = "success";
inline constexpr const char* kDryRun = "dry_run";
inline constexpr const char* kFailed = "failed";
inline constexpr const char* kSkippedMissingSource = "skipped_missing_source";
inline constexpr const char* kSkippedInvalidPath = "skipped_invalid_path";
inline constexpr const char* kSkippedMissingRecycle = "skipped_missing_recycle";
inline constexpr const char* kSkippedConflict = "skipped_conflict";
inline constexpr const char* kSkippedRiskRejected = "skipped_risk_rejected";
inline constexpr const char* kSkippedDisabled = "skipped_disabled";
inline constexpr const char* kSkippedNoCandidate = "skipped_no_candidate";
inline constexpr const char* kPartialFailed = "partial_failed";
}  // namespace status

// Scope value marking whole-system batches whose restore destinations are
// checked against the governance roots instead of the profile roots.
inline constexpr const char* kGovernanceScope = "space_governance";
inline constexpr const char* kDefaultCleanupScope = "cleanup_monthly";

// ---------------------------------------------------------------------------
// AuditRecord - one line of the audit log
// ---------------------------------------------------------------------------
struct AuditRecord {
  AuditAction action{AuditAction::unknown};
  std::string action_text;               // raw "action" value, kept for unknown actions
  uint64_t    time_ms{0};                // unix ms
  std::string scope;
  std::string batch_id;
  std::string source_path;
  std::optional<std::string> recycle_path;
  std::string status;
  std::string error;                     // empty if none
  std::string error_type;                // ErrorKind string, empty if none
  uint64_t    size_bytes{0};
  bool        dry_run{false};
  jsonlite::Object extra;                // metadata, restoredPath, invalid_reason, risk, prev...
};

// Core fields override same-named keys in `extra`.
jsonlite::Object audit_record_to_object(const AuditRecord& r);
AuditRecord audit_record_from_object(const jsonlite::Object& obj);

// ---------------------------------------------------------------------------
// CleanupTarget - one path handed in by the scanner
// ---------------------------------------------------------------------------
struct CleanupTarget {
  std::string path;
  uint64_t size_bytes{0};
  jsonlite::Object metadata;   // copied verbatim into the cleanup record
};

// Parses {"path":..., "sizeBytes":..., ...}. Every other key becomes metadata.
std::optional<CleanupTarget> cleanup_target_from_object(const jsonlite::Object& obj);

// ---------------------------------------------------------------------------
// Batch - derived view over the log
// ---------------------------------------------------------------------------
struct Batch {
  std::string batch_id;
  uint64_t first_time_ms{0};
  std::vector<AuditRecord> entries;   // restorable cleanup records, log order
  uint64_t total_bytes{0};
};

jsonlite::Object batch_to_object(const Batch& b, bool include_entries = false);

// Called before each item as (index + 1, total). Returning false stops the run
// before that item is processed.
using ProgressCallback = std::function<bool(std::size_t done, std::size_t total)>;

uint64_t now_unix_ms();

}  // namespace reclaim
