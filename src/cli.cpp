#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "reclaim/audit.hpp"
#include "reclaim/batches.hpp"
#include "reclaim/config.hpp"
#include "reclaim/fsutil.hpp"
#include "reclaim/hash.hpp"
#include "reclaim/jsonlite.hpp"
#include "reclaim/lock.hpp"
#include "reclaim/observability.hpp"
#include "reclaim/recycle.hpp"
#include "reclaim/restore.hpp"
#include "reclaim/retention.hpp"
#include "reclaim/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailures = 2;
constexpr int kExitLockHeld = 3;
constexpr int kExitConfigInvalid = 4;

void usage() {
  std::cerr
      << "usage: reclaim <command> [options]\n"
         "\n"
         "commands:\n"
         "  cleanup --targets FILE [--dry-run|--live] [--scope S]\n"
         "  batches\n"
         "  restore --batch ID [--conflict skip|overwrite|rename] [--outside-profile allow|reject]\n"
         "          [--dry-run]\n"
         "  maintain [--dry-run]\n"
         "  stats\n"
         "  doctor\n"
         "  lock status|break\n"
         "\n"
         "global options:\n"
         "  --state-root DIR  --profile-root DIR  --recycle-root DIR  --log FILE\n"
         "  --extra-profile-root DIR  --governance-root DIR  --allowed-root DIR\n";
}

void log_error(const std::string& msg) {
  std::cerr << "[reclaim] " << msg << "\n";
}

struct Args {
  std::vector<std::string> positional;
  reclaim::ConfigOverrides overrides;
  std::optional<std::string> targets_file;
  std::optional<std::string> batch_id;
  std::optional<std::string> conflict;
  std::string scope{reclaim::kDefaultCleanupScope};
  std::optional<std::string> outside_profile;
  bool dry_run{false};
  bool live{false};
  bool error{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--state-root" && has_value) a.overrides.state_root = argv[++i];
    else if (arg == "--profile-root" && has_value) a.overrides.profile_root = argv[++i];
    else if (arg == "--recycle-root" && has_value) a.overrides.recycle_root = argv[++i];
    else if (arg == "--log" && has_value) a.overrides.log_path = argv[++i];
    else if (arg == "--extra-profile-root" && has_value) a.overrides.extra_profile_roots.push_back(argv[++i]);
    else if (arg == "--governance-root" && has_value) a.overrides.extra_governance_roots.push_back(argv[++i]);
    else if (arg == "--allowed-root" && has_value) a.overrides.allowed_roots.push_back(argv[++i]);
    else if (arg == "--targets" && has_value) a.targets_file = argv[++i];
    else if (arg == "--batch" && has_value) a.batch_id = argv[++i];
    else if (arg == "--conflict" && has_value) a.conflict = argv[++i];
    else if (arg == "--outside-profile" && has_value) a.outside_profile = argv[++i];
    else if (arg == "--scope" && has_value) a.scope = argv[++i];
    else if (arg == "--dry-run") a.dry_run = true;
    else if (arg == "--live") a.live = true;
    else if (arg.rfind("--", 0) == 0) {
      log_error("unknown or incomplete option: " + arg);
      a.error = true;
    } else {
      a.positional.push_back(arg);
    }
  }
  return a;
}

// Acquires the state-root lock or reports why not. nullptr means the caller
// must exit with kExitLockHeld.
std::unique_ptr<reclaim::ProcessLock> lock_or_report(const reclaim::Config& cfg, const std::string& mode) {
  auto acquired = reclaim::acquire_lock(cfg.state_root, mode);
  if (!acquired.ok()) {
    log_error(reclaim::to_string(acquired.error_code) + ": " + acquired.message);
    return nullptr;
  }
  if (acquired.lock->info().recovered_from_stale) {
    log_error("recovered stale lock left by pid " + std::to_string(acquired.lock->info().stale_lock_pid));
  }
  return std::move(acquired.lock);
}

std::optional<std::vector<reclaim::CleanupTarget>> load_targets(const std::string& path) {
  const auto raw = reclaim::read_file(path);
  if (!raw) {
    log_error("cannot read targets file " + path);
    return std::nullopt;
  }
  std::optional<reclaim::jsonlite::JsonError> err;
  const auto obj = reclaim::jsonlite::parse(*raw, &err);
  if (err) {
    log_error("targets file " + path + ": " + err->message);
    return std::nullopt;
  }
  std::vector<reclaim::CleanupTarget> targets;
  for (const auto& item : reclaim::jsonlite::get_array(obj, "targets")) {
    if (!std::holds_alternative<reclaim::jsonlite::Object>(item.v)) continue;
    if (auto t = reclaim::cleanup_target_from_object(std::get<reclaim::jsonlite::Object>(item.v))) {
      targets.push_back(std::move(*t));
    } else {
      log_error("skipping target without a path");
    }
  }
  return targets;
}

int cmd_cleanup(const Args& args, const reclaim::Config& cfg) {
  if (!args.targets_file) {
    log_error("cleanup requires --targets FILE");
    return kExitUsage;
  }
  auto targets = load_targets(*args.targets_file);
  if (!targets) return kExitUsage;

  auto lock = lock_or_report(cfg, "cleanup");
  if (!lock) return kExitLockHeld;

  reclaim::AuditLog log(cfg.log_path);
  reclaim::CleanupOptions opts;
  opts.targets = std::move(*targets);
  opts.recycle_root = cfg.recycle_root;
  opts.scope = args.scope;
  opts.dry_run = args.dry_run || !args.live;
  opts.allowed_roots = cfg.cleanup_allowed_roots(args.scope);

  const auto summary = reclaim::execute_cleanup(*lock, log, opts);
  std::cout << summary.to_json() << "\n";
  return summary.failed_count > 0 || !summary.ok ? kExitFailures : kExitOk;
}

int cmd_batches(const reclaim::Config& cfg) {
  reclaim::jsonlite::Array out;
  for (const auto& b : reclaim::list_restorable_batches(cfg.log_path)) {
    out.push_back(reclaim::jsonlite::Value{reclaim::batch_to_object(b)});
  }
  reclaim::jsonlite::Object o;
  o["batches"] = reclaim::jsonlite::Value{std::move(out)};
  std::cout << reclaim::jsonlite::serialize(o) << "\n";
  return kExitOk;
}

int cmd_restore(const Args& args, const reclaim::Config& cfg) {
  if (!args.batch_id) {
    log_error("restore requires --batch ID");
    return kExitUsage;
  }
  reclaim::ConflictAction action = reclaim::ConflictAction::skip;
  if (args.conflict) {
    const auto parsed = reclaim::conflict_action_from_string(*args.conflict);
    if (!parsed) {
      log_error("unknown conflict strategy: " + *args.conflict);
      return kExitUsage;
    }
    action = *parsed;
  }
  bool allow_outside_profile = true;
  if (args.outside_profile) {
    if (*args.outside_profile == "reject") {
      allow_outside_profile = false;
    } else if (*args.outside_profile != "allow") {
      log_error("unknown outside-profile policy: " + *args.outside_profile);
      return kExitUsage;
    }
  }

  auto lock = lock_or_report(cfg, "restore");
  if (!lock) return kExitLockHeld;

  const auto batch = reclaim::find_batch(reclaim::list_restorable_batches(cfg.log_path), *args.batch_id);
  if (!batch) {
    log_error(reclaim::to_string(reclaim::ErrorCode::batch_not_found) + ": " + *args.batch_id);
    return kExitFailures;
  }

  reclaim::AuditLog log(cfg.log_path);
  reclaim::RestoreOptions opts;
  opts.dry_run = args.dry_run;
  opts.roots = cfg.restore_roots();
  opts.on_conflict = [action](const reclaim::ConflictContext&) {
    return reclaim::ConflictDecision{action, true};
  };
  opts.on_risk = [allow_outside_profile](const reclaim::RiskContext&) {
    return reclaim::RiskDecision{allow_outside_profile, true};
  };

  const auto summary = reclaim::restore_batch(*lock, log, *batch, opts);
  std::cout << summary.to_json() << "\n";
  return summary.fail_count > 0 || !summary.ok ? kExitFailures : kExitOk;
}

int cmd_maintain(const Args& args, const reclaim::Config& cfg) {
  auto lock = lock_or_report(cfg, "maintain");
  if (!lock) return kExitLockHeld;

  reclaim::AuditLog log(cfg.log_path);
  reclaim::MaintenanceOptions opts;
  opts.recycle_root = cfg.recycle_root;
  opts.policy = cfg.retention;
  opts.dry_run = args.dry_run;

  const auto summary = reclaim::maintain_recycle_bin(*lock, log, opts);
  std::cout << summary.to_json() << "\n";
  return summary.failed_batches > 0 || !summary.ok ? kExitFailures : kExitOk;
}

int cmd_stats(const reclaim::Config& cfg) {
  const auto stats = reclaim::collect_recycle_stats(cfg.log_path, cfg.recycle_root);
  std::cout << reclaim::jsonlite::serialize(stats.to_object()) << "\n";
  return kExitOk;
}

reclaim::jsonlite::Object lock_status(const reclaim::Config& cfg) {
  const std::string path = reclaim::resolve_lock_path(cfg.state_root);
  reclaim::jsonlite::Object o;
  o["path"] = reclaim::jsonlite::Value{path};
  const auto info = reclaim::read_lock_info(path);
  const bool present = reclaim::path_exists(path);
  o["held"] = reclaim::jsonlite::Value{present};
  if (info) {
    o["holder"] = reclaim::jsonlite::Value{reclaim::lock_info_to_object(*info)};
    o["stale"] = reclaim::jsonlite::Value{!reclaim::is_process_running(info->pid)};
  } else if (present) {
    o["stale"] = reclaim::jsonlite::Value{true};
  }
  return o;
}

int cmd_doctor(const reclaim::Config& cfg) {
  reclaim::jsonlite::Object o;
  o["config"] = reclaim::jsonlite::Value{cfg.to_object()};
  o["lock"] = reclaim::jsonlite::Value{lock_status(cfg)};

  const auto chain = reclaim::verify_chain(cfg.log_path);
  std::optional<reclaim::jsonlite::JsonError> err;
  o["audit_chain"] = reclaim::jsonlite::parse_value(chain.to_json(), &err);
  o["version"] = reclaim::jsonlite::parse_value(
      reclaim::version::manifest_to_json(reclaim::version::current_manifest()), &err);
  o["hash"] = reclaim::jsonlite::Value{reclaim::hash_runtime_info().version};
  std::cout << reclaim::jsonlite::serialize(o) << "\n";
  return chain.ok() ? kExitOk : kExitFailures;
}

int cmd_lock(const Args& args, const reclaim::Config& cfg) {
  const std::string sub = args.positional.size() >= 2 ? args.positional[1] : "status";
  if (sub == "status") {
    std::cout << reclaim::jsonlite::serialize(lock_status(cfg)) << "\n";
    return kExitOk;
  }
  if (sub == "break") {
    std::string error;
    const std::string path = reclaim::resolve_lock_path(cfg.state_root);
    if (!reclaim::break_lock(path, &error)) {
      log_error(error);
      return kExitFailures;
    }
    std::cout << "{\"broken\":true,\"path\":\"" << reclaim::jsonlite::escape(path) << "\"}\n";
    return kExitOk;
  }
  usage();
  return kExitUsage;
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.error || args.positional.empty()) {
    usage();
    return kExitUsage;
  }
  const std::string& cmd = args.positional.front();

  const auto loaded = reclaim::load_config(args.overrides);
  if (!loaded.ok()) {
    log_error(reclaim::to_string(loaded.error_code) + ": " + loaded.message);
    return kExitConfigInvalid;
  }
  const reclaim::Config& cfg = loaded.config;

  if (cmd == "cleanup") return cmd_cleanup(args, cfg);
  if (cmd == "batches") return cmd_batches(cfg);
  if (cmd == "restore") return cmd_restore(args, cfg);
  if (cmd == "maintain") return cmd_maintain(args, cfg);
  if (cmd == "stats") return cmd_stats(cfg);
  if (cmd == "doctor") return cmd_doctor(cfg);
  if (cmd == "lock") return cmd_lock(args, cfg);

  log_error("unknown command: " + cmd);
  usage();
  return kExitUsage;
}
