#include "reclaim/version.hpp"

#include "reclaim/hash.hpp"
#include "reclaim/jsonlite.hpp"

namespace reclaim {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
#ifdef PROJECT_VERSION
  m.semver = semver.empty() ? PROJECT_VERSION : semver;
#else
  m.semver = semver.empty() ? "0.0.0" : semver;
#endif
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["audit_log"] = jsonlite::Value{static_cast<std::uint64_t>(m.audit_log)};
  o["lock_file"] = jsonlite::Value{static_cast<std::uint64_t>(m.lock_file)};
  o["recycle_layout"] = jsonlite::Value{static_cast<std::uint64_t>(m.recycle_layout)};
  o["semver"] = jsonlite::Value{m.semver};
  o["hash_primitive"] = jsonlite::Value{m.hash_primitive};
  o["build_timestamp"] = jsonlite::Value{m.build_timestamp};
  return jsonlite::serialize(o);
}

bool audit_version_supported(uint64_t record_version) {
  return record_version <= AUDIT_LOG_VERSION;
}

}  // namespace version
}  // namespace reclaim
