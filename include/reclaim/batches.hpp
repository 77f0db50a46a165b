#pragma once

// reclaim/batches.hpp - Rebuilds restorable batches by replaying the log.
//
// A cleanup record is restorable when:
//   - it has a recyclePath,
//   - no restore record with status "success" names that recyclePath
//     (anywhere in the log, before or after it),
//   - something still exists at the recyclePath.
// Batches are grouped by batchId ("unknown" when empty) and returned newest
// first by their earliest record time.

#include <optional>
#include <string>
#include <vector>

#include "reclaim/types.hpp"

namespace reclaim {

std::vector<Batch> list_restorable_batches(const std::vector<AuditRecord>& records);
std::vector<Batch> list_restorable_batches(const std::string& log_path);

std::optional<Batch> find_batch(const std::vector<Batch>& batches, const std::string& batch_id);

}  // namespace reclaim
