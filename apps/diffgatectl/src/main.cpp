#include "diffgatectl/cli_api.h"

#include "diffgate/audit.h"
#include "diffgate/config.h"
#include "diffgate/log.h"
#include "diffgate/paths.h"
#include "diffgate/pipeline.h"
#include "diffgate/sanitizer.h"
#include "diffgate/scope_config.h"
#include "diffgate/scope_guard.h"
#include "diffgate_data/serialization.h"

#include <iostream>
#include <iterator>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
bool load_scope(const fs::path& scope_path, diffgate::ScopeConfigLoadResult& out) {
  out = diffgate::load_scope_config(scope_path);
  for (const auto& warning : out.warnings) {
    std::cerr << "warning: " << warning << "\n";
  }
  if (!out.ok()) {
    std::cerr << "invalid scope descriptor " << scope_path.string() << ":\n"
              << diffgate::format_scope_errors(out.errors);
    return false;
  }
  return true;
}

void print_json(const json& value) {
  std::cout << value.dump(2) << "\n";
}
} // namespace

bool read_input(const fs::path& path, std::string& out, std::string& error) {
  if (path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
      error = "failed to read standard input";
      return false;
    }
    return true;
  }
  return diffgate::data::read_text_file(path, out, error);
}

int sanitize_command(const fs::path& in_path, const std::optional<fs::path>& out_path) {
  std::string raw;
  std::string error;
  if (!read_input(in_path, raw, error)) {
    std::cerr << error << "\n";
    return kExitUsage;
  }
  const auto sanitized = diffgate::sanitize_patch(raw);
  if (!sanitized.has_value()) {
    std::cerr << "no diff found in input\n";
    return kExitNoPatch;
  }
  if (out_path.has_value()) {
    if (!diffgate::data::write_text_file(*out_path, *sanitized)) {
      std::cerr << "failed to write " << out_path->string() << "\n";
      return kExitUsage;
    }
    return kExitOk;
  }
  std::cout << *sanitized;
  return kExitOk;
}

int scope_check_command(const fs::path& scope_path,
                        const std::vector<std::string>& paths,
                        const std::optional<fs::path>& repo) {
  diffgate::ScopeConfigLoadResult scope;
  if (!load_scope(scope_path, scope)) {
    return kExitUsage;
  }
  const auto resolved = diffgate::resolve_paths(repo);
  const diffgate::ScopeGuard guard(scope.config, resolved.root);
  bool all_allowed = true;
  for (const auto& raw : paths) {
    const std::string path = diffgate::normalize_scope_path(raw);
    std::string reason;
    if (!diffgate::is_safe_rel_path(path)) {
      reason = "unsafe path";
    } else if (!guard.is_authorized(path)) {
      reason = "outside scope";
    }
    if (reason.empty()) {
      std::cout << "ALLOWED " << path << (guard.is_test_path(path) ? " (test)" : "") << "\n";
      diffgate::append_audit_record(resolved.audit_log, "scope_check", path, "allowed");
    } else {
      all_allowed = false;
      std::cout << "BLOCKED " << path << ": " << reason << "\n";
      diffgate::append_audit_record(resolved.audit_log, "scope_check", path, "blocked", reason);
    }
  }
  return all_allowed ? kExitOk : kExitBlocked;
}

int scope_filter_command(const fs::path& scope_path,
                         const std::vector<std::string>& create,
                         const std::vector<std::string>& modify,
                         const std::optional<fs::path>& repo) {
  diffgate::ScopeConfigLoadResult scope;
  if (!load_scope(scope_path, scope)) {
    return kExitUsage;
  }
  const auto resolved = diffgate::resolve_paths(repo);
  const diffgate::ScopeGuard guard(scope.config, resolved.root);
  const auto filtered = guard.filter_paths(create, modify);
  json out;
  out["allowedCreate"] = filtered.allowed_create;
  out["allowedModify"] = filtered.allowed_modify;
  json rejected = json::array();
  for (const auto& entry : filtered.rejected) {
    rejected.push_back({{"path", entry.path}, {"reason", entry.reason}});
  }
  out["rejected"] = rejected;
  print_json(out);
  return filtered.rejected.empty() ? kExitOk : kExitBlocked;
}

int validate_command(const fs::path& scope_path,
                     const fs::path& patch_path,
                     const std::optional<fs::path>& repo) {
  diffgate::ScopeConfigLoadResult scope;
  if (!load_scope(scope_path, scope)) {
    return kExitUsage;
  }
  std::string raw;
  std::string error;
  if (!read_input(patch_path, raw, error)) {
    std::cerr << error << "\n";
    return kExitUsage;
  }
  const auto sanitized = diffgate::sanitize_patch(raw);
  if (!sanitized.has_value()) {
    std::cerr << "no diff found in input\n";
    return kExitNoPatch;
  }
  const auto resolved = diffgate::resolve_paths(repo);
  const diffgate::ScopeGuard guard(scope.config, resolved.root);
  const auto validation = guard.validate_patch(diffgate::parse_patch(*sanitized));
  json out;
  out["ok"] = validation.ok;
  out["rejectedTargets"] = validation.rejected_targets;
  out["testTargets"] = validation.test_targets;
  print_json(out);
  diffgate::append_audit_record(resolved.audit_log, "validate_patch", patch_path.string(),
                                validation.ok ? "allowed" : "blocked",
                                std::to_string(validation.rejected_targets.size()) + " rejected");
  return validation.ok ? kExitOk : kExitBlocked;
}

int apply_command(const ApplyCommandOptions& opts) {
  auto paths = diffgate::resolve_paths(opts.repo, opts.staging);
  const fs::path config_path = opts.config.has_value() ? *opts.config : diffgate::default_config_path(paths.root);
  diffgate::ToolConfig cfg;
  if (!config_path.empty()) {
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
      std::cerr << "config not found: " << config_path.string() << "\n";
      return kExitUsage;
    }
    cfg = diffgate::load_tool_config(config_path);
  }
  if (opts.staging.empty() && !cfg.staging_root.empty()) {
    paths = diffgate::resolve_paths(opts.repo, cfg.staging_root);
  }
  diffgate::log::init("diffgatectl", paths.logs_dir);
  diffgate::log::Level level{};
  if (diffgate::log::parse_level(cfg.log_level, level)) {
    diffgate::log::set_level(level);
  }

  diffgate::ScopeConfigLoadResult scope;
  if (!load_scope(opts.scope_path, scope)) {
    diffgate::log::shutdown();
    return kExitUsage;
  }
  std::string raw;
  std::string error;
  if (!read_input(opts.patch_path, raw, error)) {
    std::cerr << error << "\n";
    diffgate::log::shutdown();
    return kExitUsage;
  }

  const std::string run_id = diffgate::make_run_id();
  const auto run_dir = diffgate::make_run_dir(paths, run_id, error);
  if (!run_dir.has_value()) {
    std::cerr << error << "\n";
    diffgate::log::shutdown();
    return kExitUsage;
  }
  diffgate::log::set_run_id(run_id);
  diffgate::log::info("run started in " + paths.root.string());

  diffgate::PipelineOptions pipeline;
  pipeline.apply.repo_root = paths.root;
  pipeline.apply.staging_dir = *run_dir;
  pipeline.apply.excluded_dirs = {paths.staging_root};
  pipeline.apply.git = cfg.git;
  pipeline.apply.patch = cfg.patch;
  pipeline.apply.fuzzy_fallback = cfg.fuzzy_fallback && !opts.no_fuzzy;
  pipeline.apply.diagnostic_limit = cfg.diagnostic_limit;
  pipeline.remap_missing_paths = cfg.remap_missing_paths || opts.remap;
  pipeline.audit_log = paths.audit_log;

  const diffgate::ScopeGuard guard(scope.config, paths.root);
  const auto result = diffgate::run_change_pipeline(raw, guard, pipeline);
  if (!result.sanitized.empty() &&
      !diffgate::data::write_text_file(*run_dir / "sanitized.diff", result.sanitized)) {
    diffgate::log::warn("failed to write " + (*run_dir / "sanitized.diff").string());
  }

  const json results = diffgate::pipeline_result_to_json(result, run_id);
  if (!diffgate::data::save_json_file(*run_dir / "results.json", results) ||
      !diffgate::data::save_json_file(paths.last_results, results)) {
    diffgate::log::warn("failed to write run results under " + paths.staging_root.string());
  }
  if (opts.json_out.has_value() && !diffgate::data::save_json_file(*opts.json_out, results)) {
    std::cerr << "failed to write " << opts.json_out->string() << "\n";
  }
  print_json(results);

  const std::string rejects = diffgate::summarize_rejects(result.apply);
  if (!rejects.empty()) {
    std::cerr << rejects;
  }
  diffgate::log::shutdown();

  switch (result.status) {
    case diffgate::PipelineStatus::NoPatch:
      return kExitNoPatch;
    case diffgate::PipelineStatus::Rejected:
    case diffgate::PipelineStatus::Unchanged:
      return kExitBlocked;
    case diffgate::PipelineStatus::Applied:
    case diffgate::PipelineStatus::Partial:
      return kExitOk;
  }
  return kExitBlocked;
}

int status_command(const std::optional<fs::path>& repo) {
  const auto paths = diffgate::resolve_paths(repo);
  json last;
  std::string error;
  if (!diffgate::data::load_json_file(paths.last_results, last, error)) {
    std::cout << "Last run: none\n";
    return kExitBlocked;
  }
  std::cout << "Last run: " << last.value("run_id", "") << "\n";
  std::cout << "Status: " << last.value("status", "") << "\n";
  if (last.contains("changedPaths") && last["changedPaths"].is_array()) {
    std::cout << "Changed: " << last["changedPaths"].size() << "\n";
    for (const auto& path : last["changedPaths"]) {
      if (!path.is_string()) {
        diffgate::log::warn("status: skipping non-string entry in changedPaths");
        continue;
      }
      const std::string p = path.get<std::string>();
      std::string tier;
      if (last.contains("provenance") && last["provenance"].is_object() && last["provenance"].contains(p) &&
          last["provenance"][p].is_string()) {
        tier = last["provenance"][p].get<std::string>();
      }
      std::cout << "  " << p << (tier.empty() ? "" : " [" + tier + "]") << "\n";
    }
  }
  if (last.contains("rejectedTargets") && last["rejectedTargets"].is_array() && !last["rejectedTargets"].empty()) {
    std::cout << "Rejected: " << last["rejectedTargets"].size() << "\n";
  }
  if (last.contains("rejects") && last["rejects"].is_object() && !last["rejects"].empty()) {
    std::cout << "Reject files: " << last["rejects"].size() << "\n";
  }
  return kExitOk;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  diffgatectl sanitize --in <file|-> [--out <file>]\n"
            << "  diffgatectl scope check --scope <descriptor> [--repo <dir>] <path>...\n"
            << "  diffgatectl scope filter --scope <descriptor> [--repo <dir>] [--create <path>]... [--modify <path>]...\n"
            << "  diffgatectl validate --scope <descriptor> --patch <file|-> [--repo <dir>]\n"
            << "  diffgatectl apply --scope <descriptor> --patch <file|-> [--repo <dir>] [--config <file>]\n"
            << "                    [--staging <dir>] [--remap] [--no-fuzzy] [--json <file>]\n"
            << "  diffgatectl status [--repo <dir>]\n";
}

#ifndef DIFFGATECTL_LIB
int main(int argc, char** argv) {
  diffgate::log::install_crash_handlers();
  if (argc < 2) {
    print_usage();
    return kExitUsage;
  }

  std::string command = argv[1];

  if (command == "sanitize") {
    fs::path in_path;
    std::optional<fs::path> out_path;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--in" && i + 1 < argc) {
        in_path = fs::path(argv[++i]);
      } else if (arg == "--out" && i + 1 < argc) {
        out_path = fs::path(argv[++i]);
      } else {
        print_usage();
        return kExitUsage;
      }
    }
    if (in_path.empty()) {
      print_usage();
      return kExitUsage;
    }
    return sanitize_command(in_path, out_path);
  }

  if (command == "scope" && argc >= 3) {
    std::string sub = argv[2];
    fs::path scope_path;
    std::optional<fs::path> repo;
    std::vector<std::string> create;
    std::vector<std::string> modify;
    std::vector<std::string> positional;
    for (int i = 3; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--scope" && i + 1 < argc) {
        scope_path = fs::path(argv[++i]);
      } else if (arg == "--repo" && i + 1 < argc) {
        repo = fs::path(argv[++i]);
      } else if (arg == "--create" && i + 1 < argc) {
        create.push_back(argv[++i]);
      } else if (arg == "--modify" && i + 1 < argc) {
        modify.push_back(argv[++i]);
      } else if (arg.rfind("--", 0) == 0) {
        print_usage();
        return kExitUsage;
      } else {
        positional.push_back(arg);
      }
    }
    if (scope_path.empty()) {
      print_usage();
      return kExitUsage;
    }
    if (sub == "check" && !positional.empty()) {
      return scope_check_command(scope_path, positional, repo);
    }
    if (sub == "filter" && positional.empty()) {
      return scope_filter_command(scope_path, create, modify, repo);
    }
    print_usage();
    return kExitUsage;
  }

  if (command == "validate" || command == "apply") {
    ApplyCommandOptions opts;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--scope" && i + 1 < argc) {
        opts.scope_path = fs::path(argv[++i]);
      } else if (arg == "--patch" && i + 1 < argc) {
        opts.patch_path = fs::path(argv[++i]);
      } else if (arg == "--repo" && i + 1 < argc) {
        opts.repo = fs::path(argv[++i]);
      } else if (arg == "--config" && i + 1 < argc && command == "apply") {
        opts.config = fs::path(argv[++i]);
      } else if (arg == "--staging" && i + 1 < argc && command == "apply") {
        opts.staging = argv[++i];
      } else if (arg == "--json" && i + 1 < argc && command == "apply") {
        opts.json_out = fs::path(argv[++i]);
      } else if (arg == "--remap" && command == "apply") {
        opts.remap = true;
      } else if (arg == "--no-fuzzy" && command == "apply") {
        opts.no_fuzzy = true;
      } else {
        print_usage();
        return kExitUsage;
      }
    }
    if (opts.scope_path.empty() || opts.patch_path.empty()) {
      print_usage();
      return kExitUsage;
    }
    if (command == "validate") {
      return validate_command(opts.scope_path, opts.patch_path, opts.repo);
    }
    return apply_command(opts);
  }

  if (command == "status") {
    std::optional<fs::path> repo;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--repo" && i + 1 < argc) {
        repo = fs::path(argv[++i]);
      } else {
        print_usage();
        return kExitUsage;
      }
    }
    return status_command(repo);
  }

  print_usage();
  return kExitUsage;
}
#endif
