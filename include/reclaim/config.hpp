#pragma once

// reclaim/config.hpp - Layered configuration.
//
// Precedence, lowest first:
//   1. built-in defaults
//   2. <stateRoot>/config.json
//   3. RECLAIM_* environment variables
//   4. explicit overrides (CLI flags)
// The state root itself is resolved from overrides, then RECLAIM_STATE_ROOT,
// then the default, before config.json is read.
//
// A config.json that exists but does not parse as a JSON object is fatal
// (config_invalid). A missing one is not.

#include <optional>
#include <string>
#include <vector>

#include "reclaim/restore.hpp"
#include "reclaim/retention.hpp"
#include "reclaim/types.hpp"

namespace reclaim {

struct Config {
  std::string state_root;
  std::string recycle_root;
  std::string log_path;
  std::string profile_root;
  std::string data_root;                        // inferred; empty when unknown
  std::vector<std::string> extra_profile_roots;
  std::vector<std::string> extra_governance_roots;
  std::vector<std::string> allowed_roots;       // extra cleanup scan roots
  RetentionPolicy retention;
  std::string config_file;
  bool config_file_loaded{false};

  // data_root (if known) followed by extra_governance_roots.
  std::vector<std::string> governance_roots() const;

  // Roots a cleanup source must lie under for the given scope.
  std::vector<std::string> cleanup_allowed_roots(const std::string& scope) const;

  // Destination allow-lists for restore. Built from the same roots cleanup
  // accepts, so anything cleanup moved out can be put back.
  RestoreRoots restore_roots() const;

  jsonlite::Object to_object() const;
};

struct ConfigOverrides {
  std::optional<std::string> state_root;
  std::optional<std::string> profile_root;
  std::optional<std::string> recycle_root;
  std::optional<std::string> log_path;
  std::vector<std::string> extra_profile_roots;     // appended
  std::vector<std::string> extra_governance_roots;  // appended
  std::vector<std::string> allowed_roots;           // appended
};

struct ConfigResult {
  Config config;
  ErrorCode error_code{ErrorCode::none};
  std::string message;

  bool ok() const { return error_code == ErrorCode::none; }
};

ConfigResult load_config(const ConfigOverrides& overrides = {});

std::string default_state_root();
std::string default_profile_root();

// "/x/Data/Documents/Profiles" -> "/x/Data". Empty when the marker is absent.
std::string infer_data_root(const std::string& profile_root);

// Splits on ':' and ',', dropping empty items and expanding "~/".
std::vector<std::string> split_path_list(const std::string& s);

}  // namespace reclaim
