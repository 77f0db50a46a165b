#include "reclaim/path_safety.hpp"

namespace fs = std::filesystem;

namespace reclaim {

std::optional<fs::path> canonicalize(const std::string& p) {
  if (p.empty()) return std::nullopt;
  std::error_code ec;
  const fs::path abs = fs::absolute(fs::path(p), ec);
  if (ec) return std::nullopt;
  fs::path out = fs::weakly_canonical(abs, ec);
  if (ec) return std::nullopt;
  out = out.lexically_normal();
  // "/a/b/" normalizes with an empty trailing element; drop it so component
  // comparison against "/a/b/c" works.
  if (!out.has_filename() && out.has_relative_path()) out = out.parent_path();
  return out;
}

namespace {

// 0 = outside, 1 = equal to root, 2 = strictly inside.
int containment(const fs::path& root, const fs::path& candidate) {
  const fs::path rel = candidate.lexically_relative(root);
  if (rel.empty() || rel.is_absolute()) return 0;
  const fs::path first = *rel.begin();
  if (first == "..") return 0;
  if (rel == ".") return 1;
  return 2;
}

}  // namespace

bool is_within_root(const fs::path& root, const fs::path& candidate) {
  return containment(root, candidate) > 0;
}

bool is_strictly_within_root(const fs::path& root, const fs::path& candidate) {
  return containment(root, candidate) == 2;
}

bool is_allowed(const std::string& root, const std::string& candidate) {
  const auto r = canonicalize(root);
  const auto c = canonicalize(candidate);
  if (!r || !c) return false;
  return is_within_root(*r, *c);
}

PathCheck check_against_roots(const std::vector<std::string>& roots,
                              const std::string& candidate,
                              const std::string& outside_reason) {
  PathCheck out;
  const auto resolved = canonicalize(candidate);
  if (!resolved) {
    out.reason = reason::kSourcePathUnresolvable;
    return out;
  }
  out.resolved = resolved->string();
  for (const auto& root : roots) {
    const auto r = canonicalize(root);
    if (!r) continue;
    if (is_within_root(*r, *resolved)) {
      out.allowed = true;
      out.matched_root = r->string();
      return out;
    }
  }
  out.reason = outside_reason;
  return out;
}

}  // namespace reclaim
