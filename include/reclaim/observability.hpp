#pragma once

// reclaim/observability.hpp - Structured per-operation events.
//
// DESIGN:
//   OperationEvent is the observable unit. Every engine run (cleanup, restore,
//   maintain) emits exactly one, which:
//     - updates the process-wide OperationStats counters,
//     - goes to the registered hook if one is set, otherwise
//     - is appended as one JSON line to $RECLAIM_EVENT_LOG when set.
//   Emission never fails the operation that produced it.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace reclaim {

struct OperationEvent {
  std::string operation;   // cleanup | restore | maintain
  std::string batch_id;
  bool ok{false};
  bool dry_run{false};
  uint64_t success_count{0};
  uint64_t skipped_count{0};
  uint64_t failed_count{0};
  uint64_t bytes{0};
  uint64_t audit_failures{0};
  uint64_t duration_ns{0};
  std::string error_code;
};

std::string operation_event_to_json(const OperationEvent& ev);

class OperationStats {
 public:
  void record(const OperationEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> total_operations{0};
  std::atomic<uint64_t> failed_operations{0};
  std::atomic<uint64_t> items_succeeded{0};
  std::atomic<uint64_t> items_skipped{0};
  std::atomic<uint64_t> items_failed{0};
  std::atomic<uint64_t> bytes_total{0};
  std::atomic<uint64_t> audit_failures{0};
  std::atomic<uint64_t> duration_ns_total{0};
};

OperationStats& global_operation_stats();

void emit_operation_event(const OperationEvent& ev);

using OperationEventHook = void (*)(const OperationEvent&);
void set_operation_event_hook(OperationEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace reclaim
