#pragma once

// reclaim/retention.hpp - Retention policy for the recycle bin.
//
// SELECTION (select_batches_for_maintenance):
//   1. The newest min_keep_batches batches are never selected.
//   2. Of the rest, every batch whose whole-day age >= max_age_days is
//      selected "by age".
//   3. If the indexed bytes left after removing age-selected batches still
//      exceed the threshold, further batches are selected "by size", oldest
//      first, until at or below the threshold or out of candidates.
// The size phase is greedy and oldest-first: it can evict a small batch just
// past the keep boundary while a larger, newer one survives.
//
// DELETION (maintain_recycle_bin):
//   Before a selected batch directory is removed, its batchId must be a single
//   plain path component and every entry's recycle path must resolve strictly
//   inside <recycle_root>/<batchId>. Otherwise that batch alone fails with
//   inconsistent_batch_roots. Dry run applies the same checks and deletes
//   nothing. Every run appends exactly one recycle_maintain record.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reclaim/audit.hpp"
#include "reclaim/lock.hpp"
#include "reclaim/types.hpp"

namespace reclaim {

inline constexpr uint64_t kBytesPerGB = 1024ULL * 1024ULL * 1024ULL;

struct RetentionPolicy {
  bool enabled{true};
  uint64_t max_age_days{30};
  uint64_t min_keep_batches{20};
  uint64_t size_threshold_gb{20};

  uint64_t threshold_bytes() const;
  jsonlite::Object to_object() const;
};

// Values that are not positive integers (or digit strings) take the fallback.
RetentionPolicy normalize_retention(const jsonlite::Object& input, const RetentionPolicy& fallback = {});

enum class SelectedBy { age, size };

std::string to_string(SelectedBy by);

struct SelectedBatch {
  Batch batch;
  SelectedBy selected_by{SelectedBy::age};
};

struct MaintenanceSelection {
  std::vector<Batch> keep_recent;
  std::vector<SelectedBatch> candidates;   // newest first
  uint64_t total_bytes{0};
  uint64_t threshold_bytes{0};
  uint64_t estimated_after_bytes{0};
};

MaintenanceSelection select_batches_for_maintenance(std::vector<Batch> batches,
                                                     const RetentionPolicy& policy,
                                                     uint64_t now_ms);

struct RecycleStats {
  std::vector<Batch> batches;
  uint64_t total_batches{0};
  uint64_t total_bytes{0};     // on-disk size of recycle_root
  uint64_t indexed_bytes{0};   // sum of declared sizes of restorable entries
  std::optional<uint64_t> oldest_time_ms;

  jsonlite::Object to_object() const;
};

// Never creates recycle_root.
RecycleStats collect_recycle_stats(const std::string& log_path, const std::string& recycle_root);

struct MaintenanceOptions {
  std::string recycle_root;
  RetentionPolicy policy;
  bool dry_run{false};
  ProgressCallback on_progress;
  std::optional<uint64_t> now_ms;   // defaults to the wall clock
};

struct BatchFailure {
  std::string batch_id;
  std::string message;
  std::string error_type;
  std::string invalid_reason;
};

struct MaintenanceSummary {
  bool ok{true};
  std::string error_code;
  std::string status;
  bool dry_run{false};
  RetentionPolicy policy;
  RecycleStats before;
  RecycleStats after;
  uint64_t threshold_bytes{0};
  bool over_threshold{false};
  uint64_t candidate_count{0};
  uint64_t selected_by_age{0};
  uint64_t selected_by_size{0};
  uint64_t deleted_batches{0};
  uint64_t deleted_bytes{0};
  uint64_t failed_batches{0};
  uint64_t audit_failures{0};
  std::vector<BatchFailure> errors;

  std::string to_json() const;
};

MaintenanceSummary maintain_recycle_bin(const ProcessLock& lock, AuditLog& log,
                                        const MaintenanceOptions& options);

}  // namespace reclaim
