#pragma once

// reclaim/restore.hpp - Moves a reconstructed batch back to its original
// locations.
//
// PER-ENTRY DECISION ORDER (identical for dry run and live):
//   1. recycle path missing               -> skipped_missing_recycle
//   2. recycle path outside recycle_root  -> skipped_invalid_path
//   3. destination outside allow-list     -> skipped_invalid_path
//   4. destination outside profile_root   -> RiskResolver (or carried
//                                            apply-to-all decision)
//        rejected  -> skipped_risk_rejected
//   5. destination exists                 -> ConflictResolver (or carried
//                                            apply-to-all decision)
//        skip      -> skipped_conflict
//        overwrite -> remove destination, then move
//        rename    -> move to <dest>.restored-<ms>[-n]
//   6. dry run                            -> dry_run, nothing touched
//   7. move                               -> success | failed
// Path safety always runs before either resolver is consulted, so an unsafe
// destination is never offered to the user.
//
// Entries restored outside a configured profile_root carry
// risk="out_of_profile_root", user_confirmed and profile_root.
//
// Destination allow-list:
//   scope == "space_governance"  -> governance_roots (source_outside_allowed_root)
//   otherwise                    -> profile_root + extra_profile_roots
//                                   (source_outside_profile_root)

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "reclaim/audit.hpp"
#include "reclaim/lock.hpp"
#include "reclaim/types.hpp"

namespace reclaim {

enum class ConflictAction { skip, overwrite, rename };

std::string to_string(ConflictAction action);
std::optional<ConflictAction> conflict_action_from_string(const std::string& s);

struct ConflictDecision {
  ConflictAction action{ConflictAction::skip};
  bool apply_to_all{false};
};

struct ConflictContext {
  const AuditRecord& entry;
  std::string original_path;
  std::string recycle_path;
};

using ConflictResolver = std::function<ConflictDecision(const ConflictContext&)>;

struct RiskDecision {
  bool allow{true};
  bool apply_to_all{false};
};

struct RiskContext {
  const AuditRecord& entry;
  std::string original_path;
  std::string recycle_path;
  std::string profile_root;
};

using RiskResolver = std::function<RiskDecision(const RiskContext&)>;

struct RestoreRoots {
  std::string profile_root;
  std::vector<std::string> extra_profile_roots;
  std::vector<std::string> governance_roots;
  std::string recycle_root;   // when set, recycle paths must lie strictly inside it
};

// Carries apply-to-all decisions across entries, and across restore_batch()
// calls when the caller passes the same instance.
struct RestoreCarry {
  std::optional<ConflictAction> apply_all;
  std::optional<bool> risk_apply_all;
};

struct RestoreOptions {
  bool dry_run{false};
  RestoreRoots roots;
  ConflictResolver on_conflict;   // absent resolver means skip
  RiskResolver on_risk;           // absent resolver means allow
  ProgressCallback on_progress;
};

struct RestoreError {
  std::string recycle_path;
  std::string source_path;
  std::string message;
  std::string error_type;
};

struct RestoreSummary {
  bool ok{true};
  std::string error_code;
  std::string batch_id;
  bool dry_run{false};
  uint64_t success_count{0};
  uint64_t skip_count{0};
  uint64_t fail_count{0};
  uint64_t unprocessed_count{0};
  bool stopped_early{false};
  uint64_t restored_bytes{0};
  uint64_t audit_failures{0};
  std::vector<RestoreError> errors;

  std::string to_json() const;
};

RestoreSummary restore_batch(const ProcessLock& lock, AuditLog& log, const Batch& batch,
                             const RestoreOptions& options, RestoreCarry& carry);

RestoreSummary restore_batch(const ProcessLock& lock, AuditLog& log, const Batch& batch,
                             const RestoreOptions& options);

// <original>.restored-<now_ms>, with -1, -2, ... appended while taken.
std::string make_rename_target(const std::string& original_path, uint64_t now_ms);

}  // namespace reclaim
