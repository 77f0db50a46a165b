#pragma once

// reclaim/version.hpp - Version manifest for every on-disk format.
//
// INVARIANT:
//   Any change to the audit line schema, the lock file schema or the recycle
//   directory layout must bump the matching constant. Readers tolerate older
//   versions; they never silently accept a newer one.

#include <cstdint>
#include <string>

namespace reclaim {
namespace version {

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Version 1 = JSONL, sorted keys, BLAKE3 "prev" chain over the previous line.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// LOCK_FILE_VERSION
// Version 1 = {pid, mode, hostname, startedAt, recoveredFromStale?, ...}.
// ---------------------------------------------------------------------------
constexpr uint32_t LOCK_FILE_VERSION = 1;

// ---------------------------------------------------------------------------
// RECYCLE_LAYOUT_VERSION
// Version 1 = <recycleRoot>/<batchId>/<4-digit seq>_<sanitized name>.
// ---------------------------------------------------------------------------
constexpr uint32_t RECYCLE_LAYOUT_VERSION = 1;

struct VersionManifest {
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t lock_file{LOCK_FILE_VERSION};
  uint32_t recycle_layout{RECYCLE_LAYOUT_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

// Returns false when the record was written by a newer format than this
// build understands.
bool audit_version_supported(uint64_t record_version);

}  // namespace version
}  // namespace reclaim
