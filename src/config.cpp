#include "reclaim/config.hpp"

#include "reclaim/fsutil.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace reclaim {

namespace {

constexpr const char* kProfilesMarker = "/Documents/Profiles";
constexpr const char* kDefaultProfileSuffix =
    "Library/Containers/com.tencent.WeWorkMac/Data/Documents/Profiles";

std::optional<std::string> env(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !v[0]) return std::nullopt;
  return std::string(v);
}

std::string home_dir() {
  const char* home = std::getenv("HOME");
  return (home && home[0]) ? std::string(home) : std::string(".");
}

jsonlite::Array to_array(const std::vector<std::string>& items) {
  jsonlite::Array out;
  for (const auto& s : items) out.push_back(jsonlite::Value{s});
  return out;
}

void append_all(std::vector<std::string>& dst, const std::vector<std::string>& src) {
  for (const auto& s : src) dst.push_back(expand_home(s));
}

}  // namespace

std::string default_state_root() {
  return (fs::path(home_dir()) / ".reclaim-state").string();
}

std::string default_profile_root() {
  return (fs::path(home_dir()) / kDefaultProfileSuffix).string();
}

std::string infer_data_root(const std::string& profile_root) {
  const std::string normalized = fs::path(profile_root).lexically_normal().string();
  const auto pos = normalized.find(kProfilesMarker);
  if (pos == std::string::npos || pos == 0) return {};
  return normalized.substr(0, pos);
}

std::vector<std::string> split_path_list(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ':' || c == ',') {
      if (!cur.empty()) out.push_back(expand_home(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) out.push_back(expand_home(cur));
  return out;
}

std::vector<std::string> Config::governance_roots() const {
  std::vector<std::string> out;
  if (!data_root.empty()) out.push_back(data_root);
  out.insert(out.end(), extra_governance_roots.begin(), extra_governance_roots.end());
  return out;
}

std::vector<std::string> Config::cleanup_allowed_roots(const std::string& scope) const {
  std::vector<std::string> out;
  if (scope == kGovernanceScope) {
    out = governance_roots();
    if (data_root.empty() && !profile_root.empty()) out.insert(out.begin(), profile_root);
  } else {
    if (!profile_root.empty()) out.push_back(profile_root);
    out.insert(out.end(), extra_profile_roots.begin(), extra_profile_roots.end());
  }
  out.insert(out.end(), allowed_roots.begin(), allowed_roots.end());
  return out;
}

RestoreRoots Config::restore_roots() const {
  RestoreRoots roots;
  roots.profile_root = profile_root;
  roots.extra_profile_roots = extra_profile_roots;
  roots.extra_profile_roots.insert(roots.extra_profile_roots.end(), allowed_roots.begin(),
                                   allowed_roots.end());
  roots.governance_roots = cleanup_allowed_roots(kGovernanceScope);
  roots.recycle_root = recycle_root;
  return roots;
}

jsonlite::Object Config::to_object() const {
  jsonlite::Object o;
  o["stateRoot"] = jsonlite::Value{state_root};
  o["recycleRoot"] = jsonlite::Value{recycle_root};
  o["indexPath"] = jsonlite::Value{log_path};
  o["profileRoot"] = jsonlite::Value{profile_root};
  o["dataRoot"] = data_root.empty() ? jsonlite::Value{nullptr} : jsonlite::Value{data_root};
  o["extraProfileRoots"] = jsonlite::Value{to_array(extra_profile_roots)};
  o["governanceRoots"] = jsonlite::Value{to_array(extra_governance_roots)};
  o["allowedRoots"] = jsonlite::Value{to_array(allowed_roots)};
  o["recycleRetention"] = jsonlite::Value{retention.to_object()};
  o["configFile"] = jsonlite::Value{config_file};
  o["configFileLoaded"] = jsonlite::Value{config_file_loaded};
  return o;
}

ConfigResult load_config(const ConfigOverrides& overrides) {
  ConfigResult result;
  Config& c = result.config;

  // 1. Bootstrap the state root.
  c.state_root = expand_home(overrides.state_root.value_or(
      env("RECLAIM_STATE_ROOT").value_or(default_state_root())));
  c.profile_root = default_profile_root();
  c.config_file = (fs::path(c.state_root) / "config.json").string();

  std::optional<std::string> recycle_root;
  std::optional<std::string> log_path;

  // 2. config.json
  if (path_exists(c.config_file)) {
    const auto raw = read_file(c.config_file);
    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object file = raw ? jsonlite::parse(*raw, &err) : jsonlite::Object{};
    if (!raw || err) {
      result.error_code = ErrorCode::config_invalid;
      result.message = "cannot parse " + c.config_file + (err ? ": " + err->message : "");
      return result;
    }
    c.config_file_loaded = true;
    if (jsonlite::has_string(file, "recycleRoot")) recycle_root = jsonlite::get_string(file, "recycleRoot");
    if (jsonlite::has_string(file, "indexPath")) log_path = jsonlite::get_string(file, "indexPath");
    if (jsonlite::has_string(file, "profileRoot")) c.profile_root = jsonlite::get_string(file, "profileRoot");
    append_all(c.extra_profile_roots, jsonlite::get_string_array(file, "extraProfileRoots"));
    append_all(c.extra_governance_roots, jsonlite::get_string_array(file, "governanceRoots"));
    append_all(c.allowed_roots, jsonlite::get_string_array(file, "allowedRoots"));
    c.retention = normalize_retention(jsonlite::get_object(file, "recycleRetention"));
  }

  // 3. Environment
  if (auto v = env("RECLAIM_RECYCLE_ROOT")) recycle_root = *v;
  if (auto v = env("RECLAIM_AUDIT_LOG")) log_path = *v;
  if (auto v = env("RECLAIM_PROFILE_ROOT")) c.profile_root = *v;
  if (auto v = env("RECLAIM_EXTRA_PROFILE_ROOTS")) append_all(c.extra_profile_roots, split_path_list(*v));
  if (auto v = env("RECLAIM_GOVERNANCE_ROOTS")) append_all(c.extra_governance_roots, split_path_list(*v));
  if (auto v = env("RECLAIM_ALLOWED_ROOTS")) append_all(c.allowed_roots, split_path_list(*v));

  // 4. Overrides
  if (overrides.recycle_root) recycle_root = overrides.recycle_root;
  if (overrides.log_path) log_path = overrides.log_path;
  if (overrides.profile_root) c.profile_root = *overrides.profile_root;
  append_all(c.extra_profile_roots, overrides.extra_profile_roots);
  append_all(c.extra_governance_roots, overrides.extra_governance_roots);
  append_all(c.allowed_roots, overrides.allowed_roots);

  c.profile_root = expand_home(c.profile_root);
  c.recycle_root = expand_home(recycle_root.value_or((fs::path(c.state_root) / "recycle-bin").string()));
  c.log_path = expand_home(log_path.value_or((fs::path(c.state_root) / "index.jsonl").string()));
  c.data_root = infer_data_root(c.profile_root);
  return result;
}

}  // namespace reclaim
