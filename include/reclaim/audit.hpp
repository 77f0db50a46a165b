#pragma once

// reclaim/audit.hpp - Append-only JSONL audit log; the sole durable record
// of every attempted mutation.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: lines are never modified or deleted.
//   2. ONE WRITE PER RECORD: the JSON text and its newline go out in a single
//      write(2) on an O_APPEND descriptor, followed by fdatasync.
//   3. TOLERANT READ: read_all() skips blank and unparsable lines. It never
//      fails on corruption.
//   4. CHAINED: every line carries "prev", the BLAKE3 "audit:" digest of the
//      exact previous line (audit_genesis_digest() for the first). A broken
//      chain is reported by verify_chain(); it never blocks reading.
//   5. FAIL-SAFE: append() never throws. Failures are counted per instance and
//      surfaced by the engines as audit_failures.
//
// CONCURRENCY:
//   Not internally synchronized. Only the holder of the ProcessLock for a
//   state directory writes its log.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reclaim/types.hpp"

namespace reclaim {

class AuditLog {
 public:
  // path: log file. Parent directories are created on first append.
  explicit AuditLog(std::string path);

  // Stamps "prev" and "v" onto the record's JSON and appends it.
  // Returns false if the line was not fully written.
  bool append(const AuditRecord& record);

  std::vector<AuditRecord> read_all() const;

  uint64_t entry_count() const { return entry_count_; }
  uint64_t failure_count() const { return failure_count_; }
  const std::string& path() const { return path_; }

  struct Tail {
    std::string digest;     // chain digest of the last non-blank line
    bool terminated{true};  // file ends in '\n' (or is empty)
  };

 private:
  std::string path_;
  std::optional<Tail> tail_;   // loaded lazily from the file

  uint64_t entry_count_{0};
  uint64_t failure_count_{0};
};

std::vector<AuditRecord> read_audit_log(const std::string& path);

// ---------------------------------------------------------------------------
// Chain verification
// ---------------------------------------------------------------------------
struct ChainReport {
  uint64_t lines{0};       // non-blank lines
  uint64_t records{0};     // lines that parsed as JSON objects
  uint64_t malformed{0};
  uint64_t unchained{0};   // records without "prev"
  uint64_t breaks{0};      // "prev" present but wrong
  uint64_t first_break_line{0};  // 1-based, 0 if none

  bool ok() const { return malformed == 0 && breaks == 0; }
  std::string to_json() const;
};

ChainReport verify_chain(const std::string& path);

}  // namespace reclaim
