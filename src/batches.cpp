#include "reclaim/batches.hpp"

#include "reclaim/audit.hpp"
#include "reclaim/fsutil.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace reclaim {

std::vector<Batch> list_restorable_batches(const std::vector<AuditRecord>& records) {
  std::set<std::string> restored;
  for (const auto& r : records) {
    if (r.action == AuditAction::restore && r.status == status::kSuccess && r.recycle_path) {
      restored.insert(*r.recycle_path);
    }
  }

  std::map<std::string, Batch> grouped;
  for (const auto& r : records) {
    if (r.action != AuditAction::cleanup || !r.recycle_path) continue;
    if (restored.contains(*r.recycle_path)) continue;
    if (!path_exists(*r.recycle_path)) continue;

    const std::string id = r.batch_id.empty() ? "unknown" : r.batch_id;
    auto [it, inserted] = grouped.try_emplace(id);
    Batch& b = it->second;
    if (inserted) {
      b.batch_id = id;
      b.first_time_ms = r.time_ms;
    } else if (r.time_ms != 0 && (b.first_time_ms == 0 || r.time_ms < b.first_time_ms)) {
      b.first_time_ms = r.time_ms;
    }
    b.entries.push_back(r);
    b.total_bytes += r.size_bytes;
  }

  std::vector<Batch> out;
  out.reserve(grouped.size());
  for (auto& [id, b] : grouped) out.push_back(std::move(b));
  std::sort(out.begin(), out.end(), [](const Batch& a, const Batch& b) {
    if (a.first_time_ms != b.first_time_ms) return a.first_time_ms > b.first_time_ms;
    return a.batch_id > b.batch_id;
  });
  return out;
}

std::vector<Batch> list_restorable_batches(const std::string& log_path) {
  return list_restorable_batches(read_audit_log(log_path));
}

std::optional<Batch> find_batch(const std::vector<Batch>& batches, const std::string& batch_id) {
  for (const auto& b : batches) {
    if (b.batch_id == batch_id) return b;
  }
  return std::nullopt;
}

}  // namespace reclaim
