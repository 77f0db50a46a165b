#pragma once

// reclaim/path_safety.hpp - Allow-list containment checks.
//
// Both paths are canonicalized (absolute, then weakly_canonical so symlinks in
// the existing prefix are resolved) before comparison. A candidate is inside a
// root when the relative path from root to candidate is not absolute and its
// first component is not "..". The root itself counts as inside.
//
// An empty allow-list contains nothing: every candidate is rejected.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace reclaim {

// Reason codes written to "invalid_reason".
namespace reason {
inline constexpr const char* kSourceOutsideAllowedRoot = "source_outside_allowed_root";
inline constexpr const char* kSourceOutsideProfileRoot = "source_outside_profile_root";
inline constexpr const char* kSourcePathUnresolvable = "source_path_unresolvable";
inline constexpr const char* kRecycleOutsideRecycleRoot = "recycle_outside_recycle_root";
inline constexpr const char* kInconsistentBatchRoots = "inconsistent_batch_roots";
}  // namespace reason

// Returns nullopt for an empty path or when canonicalization fails.
std::optional<std::filesystem::path> canonicalize(const std::string& p);

bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Same as is_within_root but the root itself is rejected.
bool is_strictly_within_root(const std::filesystem::path& root, const std::filesystem::path& candidate);

bool is_allowed(const std::string& root, const std::string& candidate);

struct PathCheck {
  bool allowed{false};
  std::string reason;         // empty when allowed
  std::string matched_root;   // canonical root that accepted the candidate
  std::string resolved;       // canonical candidate, empty when unresolvable
};

// Checks candidate against each root in order. `outside_reason` is reported
// when the candidate resolves but no root contains it.
PathCheck check_against_roots(const std::vector<std::string>& roots,
                              const std::string& candidate,
                              const std::string& outside_reason);

}  // namespace reclaim
