#include "reclaim/restore.hpp"

#include "reclaim/error_taxonomy.hpp"
#include "reclaim/fsutil.hpp"
#include "reclaim/observability.hpp"
#include "reclaim/path_safety.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace reclaim {

std::string to_string(ConflictAction action) {
  switch (action) {
    case ConflictAction::skip: return "skip";
    case ConflictAction::overwrite: return "overwrite";
    case ConflictAction::rename: return "rename";
  }
  return "skip";
}

std::optional<ConflictAction> conflict_action_from_string(const std::string& s) {
  if (s == "skip") return ConflictAction::skip;
  if (s == "overwrite") return ConflictAction::overwrite;
  if (s == "rename") return ConflictAction::rename;
  return std::nullopt;
}

std::string make_rename_target(const std::string& original_path, uint64_t now_ms) {
  const std::string base = original_path + ".restored-" + std::to_string(now_ms);
  std::string candidate = base;
  for (uint64_t n = 1; path_exists(candidate); ++n) {
    candidate = base + "-" + std::to_string(n);
  }
  return candidate;
}

std::string RestoreSummary::to_json() const {
  jsonlite::Object o;
  o["ok"] = jsonlite::Value{ok};
  if (!error_code.empty()) o["error_code"] = jsonlite::Value{error_code};
  o["batchId"] = jsonlite::Value{batch_id};
  o["dryRun"] = jsonlite::Value{dry_run};
  o["successCount"] = jsonlite::Value{success_count};
  o["skipCount"] = jsonlite::Value{skip_count};
  o["failCount"] = jsonlite::Value{fail_count};
  o["unprocessedCount"] = jsonlite::Value{unprocessed_count};
  o["stoppedEarly"] = jsonlite::Value{stopped_early};
  o["restoredBytes"] = jsonlite::Value{restored_bytes};
  o["auditFailures"] = jsonlite::Value{audit_failures};
  jsonlite::Array errs;
  for (const auto& e : errors) {
    jsonlite::Object eo;
    eo["recyclePath"] = jsonlite::Value{e.recycle_path};
    eo["sourcePath"] = jsonlite::Value{e.source_path};
    eo["message"] = jsonlite::Value{e.message};
    eo["error_type"] = jsonlite::Value{e.error_type};
    eo["error_label"] = jsonlite::Value{error_kind_label(error_kind_from_string(e.error_type))};
    errs.push_back(jsonlite::Value{std::move(eo)});
  }
  o["errors"] = jsonlite::Value{std::move(errs)};
  return jsonlite::serialize(o);
}

namespace {

struct DestinationCheck {
  PathCheck check;
  bool outside_profile_root{false};
};

DestinationCheck check_destination(const RestoreRoots& roots, const AuditRecord& entry) {
  DestinationCheck out;
  if (entry.scope == kGovernanceScope) {
    out.check = check_against_roots(roots.governance_roots, entry.source_path,
                                    reason::kSourceOutsideAllowedRoot);
  } else {
    std::vector<std::string> allowed;
    if (!roots.profile_root.empty()) allowed.push_back(roots.profile_root);
    allowed.insert(allowed.end(), roots.extra_profile_roots.begin(), roots.extra_profile_roots.end());
    out.check = check_against_roots(allowed, entry.source_path, reason::kSourceOutsideProfileRoot);
  }
  if (out.check.allowed) {
    out.outside_profile_root =
        !roots.profile_root.empty() && !is_allowed(roots.profile_root, entry.source_path);
  }
  return out;
}

bool recycle_path_confined(const std::string& recycle_root, const std::string& recycle_path) {
  if (recycle_root.empty()) return true;
  const auto root = canonicalize(recycle_root);
  const auto item = canonicalize(recycle_path);
  return root && item && is_strictly_within_root(*root, *item);
}

}  // namespace

RestoreSummary restore_batch(const ProcessLock& lock, AuditLog& log, const Batch& batch,
                             const RestoreOptions& options, RestoreCarry& carry) {
  RestoreSummary summary;
  summary.batch_id = batch.batch_id;
  summary.dry_run = options.dry_run;

  OperationEvent ev;
  ev.operation = "restore";
  ev.batch_id = batch.batch_id;
  ev.dry_run = options.dry_run;

  if (!lock.held()) {
    summary.ok = false;
    summary.error_code = to_string(ErrorCode::lock_not_held);
    summary.unprocessed_count = batch.entries.size();
    ev.error_code = summary.error_code;
    emit_operation_event(ev);
    return summary;
  }

  const uint64_t failures_before = log.failure_count();
  {
    ScopeTimer timer(ev.duration_ns);
    const std::size_t total = batch.entries.size();

    for (std::size_t i = 0; i < total; ++i) {
      if (options.on_progress && !options.on_progress(i + 1, total)) {
        summary.stopped_early = true;
        summary.unprocessed_count = total - i;
        break;
      }
      const AuditRecord& entry = batch.entries[i];
      const std::string recycle_path = entry.recycle_path.value_or("");
      const std::string original_path = entry.source_path;

      AuditRecord rec;
      rec.action = AuditAction::restore;
      rec.scope = entry.scope;
      rec.batch_id = batch.batch_id;
      rec.source_path = original_path;
      rec.recycle_path = recycle_path;
      rec.size_bytes = entry.size_bytes;
      rec.dry_run = options.dry_run;

      auto finish = [&]() {
        rec.time_ms = now_unix_ms();
        log.append(rec);
      };
      auto skip_invalid = [&](const std::string& why) {
        ++summary.skip_count;
        rec.status = status::kSkippedInvalidPath;
        rec.error_type = to_string(ErrorKind::path_validation_failed);
        rec.extra["invalid_reason"] = jsonlite::Value{why};
        finish();
      };

      if (recycle_path.empty() || !path_exists(recycle_path)) {
        ++summary.skip_count;
        rec.status = status::kSkippedMissingRecycle;
        finish();
        continue;
      }
      if (!recycle_path_confined(options.roots.recycle_root, recycle_path)) {
        skip_invalid(reason::kRecycleOutsideRecycleRoot);
        continue;
      }
      const DestinationCheck dest = check_destination(options.roots, entry);
      if (!dest.check.allowed) {
        skip_invalid(dest.check.reason);
        continue;
      }
      if (dest.outside_profile_root) {
        bool allow = true;
        if (carry.risk_apply_all) {
          allow = *carry.risk_apply_all;
        } else if (options.on_risk) {
          const RiskDecision decision = options.on_risk(
              RiskContext{entry, original_path, recycle_path, options.roots.profile_root});
          allow = decision.allow;
          if (decision.apply_to_all) carry.risk_apply_all = allow;
        }
        rec.extra["risk"] = jsonlite::Value{"out_of_profile_root"};
        rec.extra["user_confirmed"] = jsonlite::Value{allow};
        rec.extra["profile_root"] = jsonlite::Value{options.roots.profile_root};
        if (!allow) {
          ++summary.skip_count;
          rec.status = status::kSkippedRiskRejected;
          rec.error_type = to_string(ErrorKind::policy_skipped);
          finish();
          continue;
        }
      }

      std::string target_path = original_path;
      bool overwrite = false;
      if (path_exists(original_path)) {
        ConflictAction action = ConflictAction::skip;
        if (carry.apply_all) {
          action = *carry.apply_all;
        } else if (options.on_conflict) {
          const ConflictDecision decision =
              options.on_conflict(ConflictContext{entry, original_path, recycle_path});
          action = decision.action;
          if (decision.apply_to_all) carry.apply_all = action;
        }
        rec.extra["conflict_action"] = jsonlite::Value{to_string(action)};

        if (action == ConflictAction::skip) {
          ++summary.skip_count;
          rec.status = status::kSkippedConflict;
          rec.error_type = to_string(ErrorKind::conflict);
          finish();
          continue;
        }
        if (action == ConflictAction::rename) {
          target_path = make_rename_target(original_path, now_unix_ms());
        } else {
          overwrite = true;
        }
      }

      if (options.dry_run) {
        ++summary.success_count;
        summary.restored_bytes += entry.size_bytes;
        rec.status = status::kDryRun;
        rec.extra["restoredPath"] = jsonlite::Value{target_path};
        finish();
        continue;
      }

      FsStatus moved;
      if (overwrite) moved = remove_path(original_path);
      if (moved.ok) moved = move_path(recycle_path, target_path);

      if (moved.ok) {
        ++summary.success_count;
        summary.restored_bytes += entry.size_bytes;
        rec.status = status::kSuccess;
        rec.extra["restoredPath"] = jsonlite::Value{target_path};
      } else {
        ++summary.fail_count;
        rec.status = status::kFailed;
        rec.error = moved.message;
        rec.error_type = to_string(classify_fs_error(moved.ec));
        summary.errors.push_back(RestoreError{recycle_path, original_path, rec.error, rec.error_type});
      }
      finish();
    }
  }

  summary.audit_failures = log.failure_count() - failures_before;
  ev.ok = summary.fail_count == 0;
  ev.success_count = summary.success_count;
  ev.skipped_count = summary.skip_count;
  ev.failed_count = summary.fail_count;
  ev.bytes = summary.restored_bytes;
  ev.audit_failures = summary.audit_failures;
  emit_operation_event(ev);
  return summary;
}

RestoreSummary restore_batch(const ProcessLock& lock, AuditLog& log, const Batch& batch,
                             const RestoreOptions& options) {
  RestoreCarry carry;
  return restore_batch(lock, log, batch, options, carry);
}

}  // namespace reclaim
