#include "reclaim/recycle.hpp"

#include "reclaim/error_taxonomy.hpp"
#include "reclaim/fsutil.hpp"
#include "reclaim/observability.hpp"
#include "reclaim/path_safety.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <random>

namespace fs = std::filesystem;

namespace reclaim {

std::string make_batch_id() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);

  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
  char rand_hex[8];
  std::snprintf(rand_hex, sizeof(rand_hex), "%06x", static_cast<unsigned>(dist(rng)));
  return std::string(stamp) + "-" + rand_hex;
}

std::string sanitize_name(const std::string& source_path) {
  std::string base = fs::path(source_path).filename().string();
  if (base.empty()) base = fs::path(source_path).parent_path().filename().string();
  std::string out;
  out.reserve(base.size());
  for (char c : base) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                      (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    out.push_back(keep ? c : '_');
  }
  return out.empty() ? "unknown" : out;
}

std::string recycle_item_name(std::size_t seq, const std::string& source_path) {
  char prefix[24];
  std::snprintf(prefix, sizeof(prefix), "%04zu_", seq);
  return prefix + sanitize_name(source_path);
}

std::string CleanupSummary::to_json() const {
  jsonlite::Object o;
  o["ok"] = jsonlite::Value{ok};
  if (!error_code.empty()) o["error_code"] = jsonlite::Value{error_code};
  o["batchId"] = jsonlite::Value{batch_id};
  o["dryRun"] = jsonlite::Value{dry_run};
  o["successCount"] = jsonlite::Value{success_count};
  o["skippedCount"] = jsonlite::Value{skipped_count};
  o["failedCount"] = jsonlite::Value{failed_count};
  o["unprocessedCount"] = jsonlite::Value{unprocessed_count};
  o["stoppedEarly"] = jsonlite::Value{stopped_early};
  o["reclaimedBytes"] = jsonlite::Value{reclaimed_bytes};
  o["auditFailures"] = jsonlite::Value{audit_failures};
  jsonlite::Array errs;
  for (const auto& e : errors) {
    jsonlite::Object eo;
    eo["path"] = jsonlite::Value{e.path};
    eo["message"] = jsonlite::Value{e.message};
    eo["error_type"] = jsonlite::Value{e.error_type};
    eo["error_label"] = jsonlite::Value{error_kind_label(error_kind_from_string(e.error_type))};
    errs.push_back(jsonlite::Value{std::move(eo)});
  }
  o["errors"] = jsonlite::Value{std::move(errs)};
  return jsonlite::serialize(o);
}

CleanupSummary execute_cleanup(const ProcessLock& lock, AuditLog& log, const CleanupOptions& options) {
  CleanupSummary summary;
  summary.dry_run = options.dry_run;
  summary.batch_id = options.batch_id.empty() ? make_batch_id() : options.batch_id;

  OperationEvent ev;
  ev.operation = "cleanup";
  ev.batch_id = summary.batch_id;
  ev.dry_run = options.dry_run;

  if (!lock.held()) {
    summary.ok = false;
    summary.error_code = to_string(ErrorCode::lock_not_held);
    summary.unprocessed_count = options.targets.size();
    ev.error_code = summary.error_code;
    emit_operation_event(ev);
    return summary;
  }

  const uint64_t failures_before = log.failure_count();
  {
    ScopeTimer timer(ev.duration_ns);
    const fs::path batch_root = fs::path(options.recycle_root) / summary.batch_id;
    const std::size_t total = options.targets.size();

    for (std::size_t i = 0; i < total; ++i) {
      if (options.on_progress && !options.on_progress(i + 1, total)) {
        summary.stopped_early = true;
        summary.unprocessed_count = total - i;
        break;
      }
      const CleanupTarget& target = options.targets[i];

      AuditRecord rec;
      rec.action = AuditAction::cleanup;
      rec.scope = options.scope;
      rec.batch_id = summary.batch_id;
      rec.source_path = target.path;
      rec.size_bytes = target.size_bytes;
      rec.dry_run = options.dry_run;
      rec.extra = target.metadata;

      std::string veto;
      if (options.should_skip) veto = options.should_skip(target);
      if (!veto.empty()) {
        ++summary.skipped_count;
        rec.status = veto;
        rec.error_type = to_string(ErrorKind::policy_skipped);
      } else if (!path_exists(target.path)) {
        ++summary.skipped_count;
        rec.status = status::kSkippedMissingSource;
      } else if (const PathCheck check = check_against_roots(
                     options.allowed_roots, target.path, reason::kSourceOutsideAllowedRoot);
                 !check.allowed) {
        ++summary.skipped_count;
        rec.status = status::kSkippedInvalidPath;
        rec.error_type = to_string(ErrorKind::path_validation_failed);
        rec.extra["invalid_reason"] = jsonlite::Value{check.reason};
      } else if (options.dry_run) {
        ++summary.success_count;
        summary.reclaimed_bytes += target.size_bytes;
        rec.status = status::kDryRun;
      } else {
        const fs::path dest = batch_root / recycle_item_name(i + 1, target.path);
        rec.recycle_path = dest.string();
        const FsStatus moved = move_path(target.path, dest);
        if (moved.ok) {
          ++summary.success_count;
          summary.reclaimed_bytes += target.size_bytes;
          rec.status = status::kSuccess;
        } else {
          ++summary.failed_count;
          rec.status = status::kFailed;
          rec.error = moved.message;
          rec.error_type = to_string(classify_fs_error(moved.ec));
          summary.errors.push_back(CleanupError{target.path, rec.error, rec.error_type});
        }
      }

      rec.time_ms = now_unix_ms();
      log.append(rec);
    }
  }

  summary.audit_failures = log.failure_count() - failures_before;
  ev.ok = summary.failed_count == 0;
  ev.success_count = summary.success_count;
  ev.skipped_count = summary.skipped_count;
  ev.failed_count = summary.failed_count;
  ev.bytes = summary.reclaimed_bytes;
  ev.audit_failures = summary.audit_failures;
  emit_operation_event(ev);
  return summary;
}

}  // namespace reclaim
