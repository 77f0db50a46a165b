#include "reclaim/observability.hpp"

#include "reclaim/jsonlite.hpp"

#include <cstdio>
#include <cstdlib>

namespace reclaim {

std::string operation_event_to_json(const OperationEvent& ev) {
  jsonlite::Object o;
  o["operation"] = jsonlite::Value{ev.operation};
  o["batch_id"] = jsonlite::Value{ev.batch_id};
  o["ok"] = jsonlite::Value{ev.ok};
  o["dry_run"] = jsonlite::Value{ev.dry_run};
  o["success_count"] = jsonlite::Value{ev.success_count};
  o["skipped_count"] = jsonlite::Value{ev.skipped_count};
  o["failed_count"] = jsonlite::Value{ev.failed_count};
  o["bytes"] = jsonlite::Value{ev.bytes};
  o["audit_failures"] = jsonlite::Value{ev.audit_failures};
  o["duration_ns"] = jsonlite::Value{ev.duration_ns};
  o["error_code"] = jsonlite::Value{ev.error_code};
  return jsonlite::serialize(o);
}

// ---------------------------------------------------------------------------
// OperationStats
// ---------------------------------------------------------------------------

void OperationStats::record(const OperationEvent& ev) {
  total_operations.fetch_add(1, std::memory_order_relaxed);
  if (!ev.ok) failed_operations.fetch_add(1, std::memory_order_relaxed);
  items_succeeded.fetch_add(ev.success_count, std::memory_order_relaxed);
  items_skipped.fetch_add(ev.skipped_count, std::memory_order_relaxed);
  items_failed.fetch_add(ev.failed_count, std::memory_order_relaxed);
  bytes_total.fetch_add(ev.bytes, std::memory_order_relaxed);
  audit_failures.fetch_add(ev.audit_failures, std::memory_order_relaxed);
  duration_ns_total.fetch_add(ev.duration_ns, std::memory_order_relaxed);
}

std::string OperationStats::to_json() const {
  jsonlite::Object o;
  o["total_operations"] = jsonlite::Value{total_operations.load(std::memory_order_relaxed)};
  o["failed_operations"] = jsonlite::Value{failed_operations.load(std::memory_order_relaxed)};
  o["items_succeeded"] = jsonlite::Value{items_succeeded.load(std::memory_order_relaxed)};
  o["items_skipped"] = jsonlite::Value{items_skipped.load(std::memory_order_relaxed)};
  o["items_failed"] = jsonlite::Value{items_failed.load(std::memory_order_relaxed)};
  o["bytes_total"] = jsonlite::Value{bytes_total.load(std::memory_order_relaxed)};
  o["audit_failures"] = jsonlite::Value{audit_failures.load(std::memory_order_relaxed)};
  o["duration_ns_total"] = jsonlite::Value{duration_ns_total.load(std::memory_order_relaxed)};
  return jsonlite::serialize(o);
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

OperationStats& global_operation_stats() {
  static OperationStats inst;
  return inst;
}

namespace {
std::atomic<OperationEventHook> g_event_hook{nullptr};
}

void set_operation_event_hook(OperationEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_operation_event(const OperationEvent& ev) {
  global_operation_stats().record(ev);

  OperationEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("RECLAIM_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = operation_event_to_json(ev) + "\n";
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace reclaim
