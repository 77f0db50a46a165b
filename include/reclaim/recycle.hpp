#pragma once

// reclaim/recycle.hpp - Cleanup executor: moves live paths into a per-batch
// recycle directory and records every outcome in the audit log.
//
// PER-TARGET DECISION ORDER (identical for dry run and live):
//   1. policy veto          -> the policy's status, error_type=policy_skipped
//   2. source missing       -> skipped_missing_source
//   3. outside allow-list   -> skipped_invalid_path + invalid_reason
//   4. dry run              -> dry_run, nothing touched
//   5. move                 -> success | failed (error + classified error_type)
// Only step 5 touches the filesystem. A record is appended before the next
// target is considered; one target's failure never stops the batch.
//
// LAYOUT:
//   <recycle_root>/<batch_id>/<4-digit seq>_<sanitized basename>
//   seq is the 1-based position in the target list.

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "reclaim/audit.hpp"
#include "reclaim/lock.hpp"
#include "reclaim/types.hpp"

namespace reclaim {

// Returns a non-empty status string to veto a target.
using SkipPolicy = std::function<std::string(const CleanupTarget&)>;

struct CleanupOptions {
  std::vector<CleanupTarget> targets;
  std::string recycle_root;
  std::vector<std::string> allowed_roots;   // empty rejects everything
  std::string scope{kDefaultCleanupScope};
  bool dry_run{false};
  SkipPolicy should_skip;
  ProgressCallback on_progress;
  std::string batch_id;                     // generated when empty
};

struct CleanupError {
  std::string path;
  std::string message;
  std::string error_type;
};

struct CleanupSummary {
  bool ok{true};
  std::string error_code;       // engine-level only (lock_not_held)
  std::string batch_id;
  bool dry_run{false};
  uint64_t success_count{0};
  uint64_t skipped_count{0};
  uint64_t failed_count{0};
  uint64_t unprocessed_count{0};
  bool stopped_early{false};
  uint64_t reclaimed_bytes{0};
  uint64_t audit_failures{0};
  std::vector<CleanupError> errors;

  std::string to_json() const;
};

CleanupSummary execute_cleanup(const ProcessLock& lock, AuditLog& log, const CleanupOptions& options);

// yyyymmdd-hhmmss-<6 hex>, local time.
std::string make_batch_id();

// Basename with every byte outside [A-Za-z0-9._-] replaced by '_';
// "unknown" when that leaves nothing.
std::string sanitize_name(const std::string& source_path);

std::string recycle_item_name(std::size_t seq, const std::string& source_path);

}  // namespace reclaim
