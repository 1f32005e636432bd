#include "diffgate/pipeline.h"

#include "diffgate/audit.h"
#include "diffgate/log.h"
#include "diffgate/sanitizer.h"
#include "diffgate_data/serialization.h"

#include <algorithm>

namespace diffgate {

namespace {
const char* section_state_name(SectionState state) {
  switch (state) {
    case SectionState::Pending:
      return "pending";
    case SectionState::Applied:
      return "applied";
    case SectionState::Unchanged:
      return "unchanged";
  }
  return "pending";
}

PipelineStatus status_from_apply(const ApplyResult& apply) {
  if (apply.changed_paths.empty()) {
    return PipelineStatus::Unchanged;
  }
  if (!apply.rejects.empty()) {
    return PipelineStatus::Partial;
  }
  for (const auto& section : apply.sections) {
    if (section.state != SectionState::Applied) {
      return PipelineStatus::Partial;
    }
  }
  return PipelineStatus::Applied;
}
} // namespace

const char* pipeline_status_name(PipelineStatus status) {
  switch (status) {
    case PipelineStatus::NoPatch:
      return "no_patch";
    case PipelineStatus::Rejected:
      return "rejected";
    case PipelineStatus::Applied:
      return "applied";
    case PipelineStatus::Partial:
      return "partial";
    case PipelineStatus::Unchanged:
      return "unchanged";
  }
  return "unchanged";
}

PipelineResult run_change_pipeline(std::string_view raw,
                                   const ScopeGuard& guard,
                                   const PipelineOptions& options) {
  PipelineResult result;
  const auto sanitized = sanitize_patch(raw);
  if (!sanitized.has_value()) {
    log::info("no diff found in input");
    append_audit_record(options.audit_log, "sanitize", "", "no_patch");
    return result;
  }
  result.sanitized = *sanitized;
  PatchDocument patch = parse_patch(result.sanitized);
  if (patch.empty()) {
    log::info("diff header found but no file sections parsed");
    append_audit_record(options.audit_log, "sanitize", "", "no_patch");
    return result;
  }

  if (options.remap_missing_paths) {
    std::vector<std::filesystem::path> excluded{options.apply.staging_dir};
    excluded.insert(excluded.end(), options.apply.excluded_dirs.begin(), options.apply.excluded_dirs.end());
    const auto files = list_repo_files(options.apply.repo_root, excluded);
    RemapResult remap = remap_missing_paths(patch, options.apply.repo_root, files);
    result.remapped = std::move(remap.remapped);
    result.unresolved = std::move(remap.unresolved);
    for (const auto& entry : result.remapped) {
      append_audit_record(options.audit_log, "remap", entry.from, "remapped", entry.to);
    }
    if (!result.remapped.empty()) {
      patch = std::move(remap.patch);
    }
  }

  result.validation = guard.validate_patch(patch);
  // One record per declared path, so a rename logs its source as well.
  for (const auto& change : patch.files) {
    for (const auto& declared : declared_paths(change)) {
      const std::string target = normalize_scope_path(declared);
      const bool rejected = std::find(result.validation.rejected_targets.begin(),
                                      result.validation.rejected_targets.end(),
                                      target) != result.validation.rejected_targets.end();
      append_audit_record(options.audit_log, "validate_patch", target, rejected ? "blocked" : "allowed");
    }
  }
  if (!result.validation.ok) {
    result.status = PipelineStatus::Rejected;
    result.apply.rejected_targets = result.validation.rejected_targets;
    log::warn("patch rejected by scope guard; nothing applied");
    return result;
  }
  if (!result.validation.rejected_targets.empty()) {
    log::warn("non-strict scope: applying despite " +
              std::to_string(result.validation.rejected_targets.size()) + " unauthorized target(s)");
  }

  ApplyEngine engine(guard, options.apply);
  result.apply = engine.apply(patch);
  result.status = status_from_apply(result.apply);
  for (const auto& section : result.apply.sections) {
    std::string details;
    if (section.state == SectionState::Applied) {
      details = std::string(tier_name(section.tier)) + " " + section.strategy;
    }
    append_audit_record(options.audit_log, "apply", section.path, section_state_name(section.state), details);
  }
  return result;
}

nlohmann::json pipeline_result_to_json(const PipelineResult& result, const std::string& run_id) {
  nlohmann::json out;
  if (!run_id.empty()) {
    out["run_id"] = run_id;
  }
  out["ok"] = result.status != PipelineStatus::NoPatch && result.validation.ok;
  out["status"] = pipeline_status_name(result.status);
  out["rejectedTargets"] = result.validation.rejected_targets;
  out["testTargets"] = result.validation.test_targets;
  out["changedPaths"] = result.apply.changed_paths;

  nlohmann::json provenance = nlohmann::json::object();
  for (const auto& [path, tier] : result.apply.provenance) {
    provenance[path] = tier_name(tier);
  }
  out["provenance"] = provenance;
  out["strategies"] = result.apply.strategies;
  out["diagnostics"] = result.apply.diagnostics;
  out["rejects"] = result.apply.rejects;

  nlohmann::json remapped = nlohmann::json::object();
  for (const auto& entry : result.remapped) {
    remapped[entry.from] = entry.to;
  }
  out["remapped"] = remapped;
  if (!result.unresolved.empty()) {
    out["unresolved"] = result.unresolved;
  }

  nlohmann::json attempts = nlohmann::json::array();
  for (const auto& attempt : result.apply.attempts) {
    nlohmann::json a;
    a["tier"] = tier_name(attempt.tier);
    a["strategy"] = attempt.strategy;
    a["section"] = attempt.section;
    a["success"] = attempt.success;
    a["partial"] = attempt.partial;
    a["exit_code"] = attempt.exit_code;
    attempts.push_back(a);
  }
  out["attempts"] = attempts;
  return out;
}

std::string summarize_rejects(const ApplyResult& result,
                              size_t max_previews,
                              size_t preview_chars,
                              size_t max_names) {
  if (result.rejects.empty()) {
    return {};
  }
  std::string names;
  std::string previews;
  size_t listed = 0;
  for (const auto& [path, reject_file] : result.rejects) {
    if (listed < max_names) {
      names += "- " + reject_file + " (" + path + ")\n";
    }
    if (listed < max_previews) {
      std::string text;
      std::string error;
      if (!diffgate::data::read_text_file(reject_file, text, error)) {
        text = error;
      }
      if (text.size() > preview_chars) {
        text.resize(preview_chars);
      }
      previews += "\n--- " + reject_file + " ---\n" + text;
    }
    ++listed;
  }
  std::string out = "Some hunks could not be placed and were written to reject files:\n" + names;
  if (listed > max_names) {
    out += "... and " + std::to_string(listed - max_names) + " more\n";
  }
  out += previews;
  if (!out.empty() && out.back() != '\n') {
    out.push_back('\n');
  }
  return out;
}

} // namespace diffgate
