#include "reclaim/retention.hpp"

#include "reclaim/batches.hpp"
#include "reclaim/error_taxonomy.hpp"
#include "reclaim/fsutil.hpp"
#include "reclaim/observability.hpp"
#include "reclaim/path_safety.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace reclaim {

namespace {

constexpr uint64_t kMsPerDay = 24ULL * 3600ULL * 1000ULL;

// Accepts u64, integral doubles and leading-digit strings ("30", " 7days").
std::optional<uint64_t> positive_int(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  const auto& v = it->second.v;
  if (std::holds_alternative<std::uint64_t>(v)) {
    const uint64_t n = std::get<std::uint64_t>(v);
    return n >= 1 ? std::optional<uint64_t>(n) : std::nullopt;
  }
  if (std::holds_alternative<double>(v)) {
    const double d = std::get<double>(v);
    if (d >= 1.0 && d < 1e18 && std::floor(d) == d) return static_cast<uint64_t>(d);
    return std::nullopt;
  }
  if (std::holds_alternative<std::string>(v)) {
    const std::string& s = std::get<std::string>(v);
    std::size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    errno = 0;
    const unsigned long long n = std::strtoull(s.c_str() + i, nullptr, 10);
    if (errno == ERANGE || n < 1) return std::nullopt;
    return static_cast<uint64_t>(n);
  }
  return std::nullopt;
}

uint64_t age_days(uint64_t ts_ms, uint64_t now_ms) {
  const uint64_t delta = now_ms > ts_ms ? now_ms - ts_ms : 0;
  return delta / kMsPerDay;
}

bool is_plain_component(const std::string& id) {
  if (id.empty() || id == "." || id == "..") return false;
  return id.find('/') == std::string::npos && id.find('\0') == std::string::npos;
}

// Empty string when every entry of the batch lives under its batch directory.
std::string batch_root_violation(const fs::path& recycle_root, const Batch& batch) {
  if (!is_plain_component(batch.batch_id)) return reason::kInconsistentBatchRoots;
  const auto root = canonicalize((recycle_root / batch.batch_id).string());
  if (!root) return reason::kInconsistentBatchRoots;
  for (const auto& e : batch.entries) {
    const auto item = canonicalize(e.recycle_path.value_or(""));
    if (!item || !is_strictly_within_root(*root, *item)) return reason::kInconsistentBatchRoots;
  }
  return {};
}

}  // namespace

// ---------------------------------------------------------------------------
// RetentionPolicy
// ---------------------------------------------------------------------------

uint64_t RetentionPolicy::threshold_bytes() const {
  return std::max<uint64_t>(1, size_threshold_gb) * kBytesPerGB;
}

jsonlite::Object RetentionPolicy::to_object() const {
  jsonlite::Object o;
  o["enabled"] = jsonlite::Value{enabled};
  o["maxAgeDays"] = jsonlite::Value{max_age_days};
  o["minKeepBatches"] = jsonlite::Value{min_keep_batches};
  o["sizeThresholdGB"] = jsonlite::Value{size_threshold_gb};
  return o;
}

RetentionPolicy normalize_retention(const jsonlite::Object& input, const RetentionPolicy& fallback) {
  RetentionPolicy out;
  out.enabled = jsonlite::has_bool(input, "enabled") ? jsonlite::get_bool(input, "enabled") : fallback.enabled;
  out.max_age_days = positive_int(input, "maxAgeDays")
                         .value_or(fallback.max_age_days >= 1 ? fallback.max_age_days : 30);
  out.min_keep_batches = positive_int(input, "minKeepBatches")
                             .value_or(fallback.min_keep_batches >= 1 ? fallback.min_keep_batches : 20);
  out.size_threshold_gb = positive_int(input, "sizeThresholdGB")
                              .value_or(fallback.size_threshold_gb >= 1 ? fallback.size_threshold_gb : 20);
  return out;
}

std::string to_string(SelectedBy by) {
  return by == SelectedBy::age ? "age" : "size";
}

// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------

MaintenanceSelection select_batches_for_maintenance(std::vector<Batch> batches,
                                                     const RetentionPolicy& policy,
                                                     uint64_t now_ms) {
  std::stable_sort(batches.begin(), batches.end(), [](const Batch& a, const Batch& b) {
    return a.first_time_ms > b.first_time_ms;
  });

  MaintenanceSelection sel;
  sel.threshold_bytes = policy.threshold_bytes();
  for (const auto& b : batches) sel.total_bytes += b.total_bytes;

  const std::size_t keep = std::min<std::size_t>(batches.size(), policy.min_keep_batches);
  const uint64_t max_age = std::max<uint64_t>(1, policy.max_age_days);
  sel.keep_recent.assign(batches.begin(), batches.begin() + static_cast<std::ptrdiff_t>(keep));

  std::set<std::size_t> chosen;
  uint64_t selected_bytes = 0;
  for (std::size_t i = keep; i < batches.size(); ++i) {
    if (age_days(batches[i].first_time_ms, now_ms) >= max_age) {
      chosen.insert(i);
      selected_bytes += batches[i].total_bytes;
      sel.candidates.push_back(SelectedBatch{batches[i], SelectedBy::age});
    }
  }

  uint64_t estimated = sel.total_bytes - selected_bytes;
  if (estimated > sel.threshold_bytes) {
    // Oldest first: walk the newest-first list backwards.
    for (std::size_t i = batches.size(); i > keep; --i) {
      const std::size_t idx = i - 1;
      if (chosen.contains(idx)) continue;
      chosen.insert(idx);
      sel.candidates.push_back(SelectedBatch{batches[idx], SelectedBy::size});
      estimated -= std::min(estimated, batches[idx].total_bytes);
      if (estimated <= sel.threshold_bytes) break;
    }
  }
  sel.estimated_after_bytes = estimated;

  std::stable_sort(sel.candidates.begin(), sel.candidates.end(),
                   [](const SelectedBatch& a, const SelectedBatch& b) {
                     return a.batch.first_time_ms > b.batch.first_time_ms;
                   });
  return sel;
}

// ---------------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------------

jsonlite::Object RecycleStats::to_object() const {
  jsonlite::Object o;
  o["totalBatches"] = jsonlite::Value{total_batches};
  o["totalBytes"] = jsonlite::Value{total_bytes};
  o["indexedBytes"] = jsonlite::Value{indexed_bytes};
  o["oldestTime"] = oldest_time_ms ? jsonlite::Value{*oldest_time_ms} : jsonlite::Value{nullptr};
  return o;
}

RecycleStats collect_recycle_stats(const std::string& log_path, const std::string& recycle_root) {
  RecycleStats stats;
  stats.batches = list_restorable_batches(log_path);
  stats.total_batches = stats.batches.size();
  for (const auto& b : stats.batches) {
    stats.indexed_bytes += b.total_bytes;
    if (!stats.oldest_time_ms || b.first_time_ms < *stats.oldest_time_ms) {
      stats.oldest_time_ms = b.first_time_ms;
    }
  }
  stats.total_bytes = directory_size(recycle_root);
  return stats;
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

std::string MaintenanceSummary::to_json() const {
  jsonlite::Object o;
  o["ok"] = jsonlite::Value{ok};
  if (!error_code.empty()) o["error_code"] = jsonlite::Value{error_code};
  o["status"] = jsonlite::Value{status};
  o["dryRun"] = jsonlite::Value{dry_run};
  o["policy"] = jsonlite::Value{policy.to_object()};
  o["before"] = jsonlite::Value{before.to_object()};
  o["after"] = jsonlite::Value{after.to_object()};
  o["thresholdBytes"] = jsonlite::Value{threshold_bytes};
  o["overThreshold"] = jsonlite::Value{over_threshold};
  o["candidateCount"] = jsonlite::Value{candidate_count};
  o["selectedByAge"] = jsonlite::Value{selected_by_age};
  o["selectedBySize"] = jsonlite::Value{selected_by_size};
  o["deletedBatches"] = jsonlite::Value{deleted_batches};
  o["deletedBytes"] = jsonlite::Value{deleted_bytes};
  o["failBatches"] = jsonlite::Value{failed_batches};
  o["auditFailures"] = jsonlite::Value{audit_failures};
  jsonlite::Array errs;
  for (const auto& e : errors) {
    jsonlite::Object eo;
    eo["batchId"] = jsonlite::Value{e.batch_id};
    eo["message"] = jsonlite::Value{e.message};
    eo["error_type"] = jsonlite::Value{e.error_type};
    eo["error_label"] = jsonlite::Value{error_kind_label(error_kind_from_string(e.error_type))};
    if (!e.invalid_reason.empty()) eo["invalid_reason"] = jsonlite::Value{e.invalid_reason};
    errs.push_back(jsonlite::Value{std::move(eo)});
  }
  o["errors"] = jsonlite::Value{std::move(errs)};
  return jsonlite::serialize(o);
}

namespace {

void append_maintain_record(AuditLog& log, const MaintenanceOptions& options,
                            const MaintenanceSummary& s) {
  AuditRecord rec;
  rec.action = AuditAction::recycle_maintain;
  rec.time_ms = now_unix_ms();
  rec.status = s.status;
  rec.dry_run = s.dry_run;
  if (!s.errors.empty()) rec.error_type = s.errors.front().error_type;

  auto& x = rec.extra;
  x["recycle_root"] = jsonlite::Value{options.recycle_root};
  x["policy"] = jsonlite::Value{s.policy.to_object()};
  x["threshold_bytes"] = jsonlite::Value{s.threshold_bytes};
  x["over_threshold"] = jsonlite::Value{s.over_threshold};
  x["before_batches"] = jsonlite::Value{s.before.total_batches};
  x["before_bytes"] = jsonlite::Value{s.before.total_bytes};
  x["deleted_batches"] = jsonlite::Value{s.deleted_batches};
  x["deleted_bytes"] = jsonlite::Value{s.deleted_bytes};
  x["failed_batches"] = jsonlite::Value{s.failed_batches};
  x["selected_by_age"] = jsonlite::Value{s.selected_by_age};
  x["selected_by_size"] = jsonlite::Value{s.selected_by_size};
  x["remaining_batches"] = jsonlite::Value{s.after.total_batches};
  x["remaining_bytes"] = jsonlite::Value{s.after.total_bytes};
  for (const auto& e : s.errors) {
    if (!e.invalid_reason.empty()) {
      x["invalid_reason"] = jsonlite::Value{e.invalid_reason};
      break;
    }
  }
  log.append(rec);
}

}  // namespace

MaintenanceSummary maintain_recycle_bin(const ProcessLock& lock, AuditLog& log,
                                        const MaintenanceOptions& options) {
  MaintenanceSummary summary;
  summary.dry_run = options.dry_run;
  summary.policy = options.policy;

  OperationEvent ev;
  ev.operation = "maintain";
  ev.dry_run = options.dry_run;

  if (!lock.held()) {
    summary.ok = false;
    summary.error_code = to_string(ErrorCode::lock_not_held);
    ev.error_code = summary.error_code;
    emit_operation_event(ev);
    return summary;
  }

  const uint64_t failures_before = log.failure_count();
  {
    ScopeTimer timer(ev.duration_ns);
    const uint64_t now = options.now_ms.value_or(now_unix_ms());
    summary.before = collect_recycle_stats(log.path(), options.recycle_root);
    const MaintenanceSelection sel =
        select_batches_for_maintenance(summary.before.batches, summary.policy, now);

    summary.threshold_bytes = sel.threshold_bytes;
    summary.over_threshold = summary.before.total_bytes > sel.threshold_bytes;
    summary.candidate_count = sel.candidates.size();
    for (const auto& c : sel.candidates) {
      if (c.selected_by == SelectedBy::age) ++summary.selected_by_age;
      else ++summary.selected_by_size;
    }

    if (!summary.policy.enabled || sel.candidates.empty()) {
      summary.status = summary.policy.enabled ? status::kSkippedNoCandidate : status::kSkippedDisabled;
      summary.after = summary.before;
      append_maintain_record(log, options, summary);
    } else {
      const fs::path recycle_root(options.recycle_root);
      const std::size_t total = sel.candidates.size();
      for (std::size_t i = 0; i < total; ++i) {
        if (options.on_progress && !options.on_progress(i + 1, total)) break;
        const Batch& batch = sel.candidates[i].batch;

        const std::string violation = batch_root_violation(recycle_root, batch);
        if (!violation.empty()) {
          ++summary.failed_batches;
          summary.errors.push_back(BatchFailure{
              batch.batch_id, "batch entries do not all resolve inside " +
                                  (recycle_root / batch.batch_id).string(),
              to_string(ErrorKind::path_validation_failed), violation});
          continue;
        }
        if (options.dry_run) {
          ++summary.deleted_batches;
          summary.deleted_bytes += batch.total_bytes;
          continue;
        }
        const FsStatus removed = remove_path(recycle_root / batch.batch_id);
        if (removed.ok) {
          ++summary.deleted_batches;
          summary.deleted_bytes += batch.total_bytes;
        } else {
          ++summary.failed_batches;
          summary.errors.push_back(BatchFailure{batch.batch_id, removed.message,
                                                to_string(classify_fs_error(removed.ec)), ""});
        }
      }

      summary.after = options.dry_run ? summary.before
                                      : collect_recycle_stats(log.path(), options.recycle_root);
      summary.status = summary.failed_batches > 0 ? status::kPartialFailed
                       : options.dry_run          ? status::kDryRun
                                                  : status::kSuccess;
      append_maintain_record(log, options, summary);
    }
  }

  summary.audit_failures = log.failure_count() - failures_before;
  ev.ok = summary.failed_batches == 0;
  ev.success_count = summary.deleted_batches;
  ev.failed_count = summary.failed_batches;
  ev.bytes = summary.deleted_bytes;
  ev.audit_failures = summary.audit_failures;
  emit_operation_event(ev);
  return summary;
}

}  // namespace reclaim
