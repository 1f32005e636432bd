#include "diffgate/apply_engine.h"

#include "diffgate/log.h"
#include "diffgate/subprocess.h"
#include "diffgate_data/serialization.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>
#include <system_error>

namespace diffgate {

namespace fs = std::filesystem;

namespace {
std::string with_trailing_newline(std::string text) {
  if (!text.empty() && text.back() != '\n') {
    text.push_back('\n');
  }
  return text;
}

// "003_src_main.cpp" for the fourth section targeting src/main.cpp.
std::string section_file_stem(size_t index, const std::string& target) {
  char prefix[16];
  std::snprintf(prefix, sizeof(prefix), "%03zu_", index);
  std::string name = prefix;
  for (const char c : target) {
    const unsigned char uc = static_cast<unsigned char>(c);
    name.push_back(std::isalnum(uc) || c == '.' || c == '-' ? c : '_');
  }
  if (name.size() > 100) {
    name.resize(100);
  }
  return name;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += sep;
    out += item;
  }
  return out;
}

bool any_declared_changed(const TreeChanges& changes, const std::vector<std::string>& declared) {
  for (const auto& path : declared) {
    if (changes.contains(path)) return true;
  }
  return false;
}

void remove_if_exists(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
}

bool is_empty_file(const fs::path& path) {
  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  return !ec && size == 0;
}
} // namespace

ApplyEngine::ApplyEngine(const ScopeGuard& guard, ApplyEngineOptions options)
    : guard_(guard), options_(std::move(options)) {
  patches_dir_ = options_.staging_dir / "patches";
  rejects_dir_ = options_.staging_dir / "rejects";
}

ApplyResult ApplyEngine::apply(const PatchDocument& patch) {
  ApplyResult result;
  const PatchValidation validation = guard_.validate_patch(patch);
  result.rejected_targets = validation.rejected_targets;
  if (!validation.ok) {
    log::warn("apply refused: " + std::to_string(validation.rejected_targets.size()) +
              " target(s) outside scope: " + join(validation.rejected_targets, ", "));
    return result;
  }
  result.ok = true;
  if (patch.empty()) {
    return result;
  }

  result.sections.resize(patch.files.size());
  for (size_t i = 0; i < patch.files.size(); ++i) {
    result.sections[i].path = normalize_scope_path(patch.files[i].target_path());
  }

  std::error_code ec;
  fs::create_directories(patches_dir_, ec);
  if (!ec) fs::create_directories(rejects_dir_, ec);
  if (ec) {
    const std::string message = "cannot create staging directory " + options_.staging_dir.string() +
                                ": " + ec.message();
    log::error(message);
    for (auto& section : result.sections) {
      section.state = SectionState::Unchanged;
      section.diagnostics = message;
      result.diagnostics[section.path] = message;
    }
    return result;
  }

  // S1: the whole diff at once.
  std::vector<const FileChange*> all_files;
  for (const auto& change : patch.files) {
    all_files.push_back(&change);
  }
  const fs::path whole_file = patches_dir_ / "whole.diff";
  std::string whole_diagnostic;
  if (diffgate::data::write_text_file(whole_file, with_trailing_newline(patch.text))) {
    const auto matrix = git_apply_matrix(ApplyTier::WholePatch, whole_file,
                                         patch_uses_ab_prefix(patch.text), options_.git);
    AttemptOutcome whole;
    const ApplyStrategy* winner = first_success(matrix, [&](const ApplyStrategy& strategy) {
      whole = run_attempt(strategy, all_files, "*", result);
      if (!whole.success && !whole.diagnostic.empty()) {
        whole_diagnostic = whole.diagnostic;
      }
      return whole.success;
    });
    if (winner != nullptr) {
      for (size_t i = 0; i < patch.files.size(); ++i) {
        if (!any_declared_changed(whole.changes, declared_paths(patch.files[i]))) continue;
        auto& section = result.sections[i];
        section.state = SectionState::Applied;
        section.tier = ApplyTier::WholePatch;
        section.strategy = winner->id;
      }
    }
  } else {
    whole_diagnostic = "cannot write " + whole_file.string();
    log::error(whole_diagnostic);
  }

  // S2 to S4, section by section, for whatever S1 did not change.
  for (size_t i = 0; i < patch.files.size(); ++i) {
    auto& section = result.sections[i];
    if (section.state != SectionState::Pending) continue;
    const FileChange& change = patch.files[i];
    std::string diagnostics;
    if (!whole_diagnostic.empty()) {
      diagnostics = "[S1] " + whole_diagnostic + "\n";
    }

    const auto ladder = section_ladder(change, i);
    if (ladder.empty()) {
      diagnostics += "cannot stage section file\n";
    }
    AttemptOutcome outcome;
    const ApplyStrategy* winner = first_success(ladder, [&](const ApplyStrategy& strategy) {
      outcome = run_attempt(strategy, {&change}, section.path, result);
      if (!outcome.success) {
        diagnostics += "[" + std::string(tier_name(strategy.tier)) + "] " + strategy.id + ": " +
                       outcome.diagnostic + "\n";
      }
      return outcome.success;
    });

    if (winner == nullptr) {
      section.state = SectionState::Unchanged;
      section.diagnostics = diagnostics;
      log::warn("section unchanged after all strategies: " + section.path);
      continue;
    }
    section.state = SectionState::Applied;
    section.tier = winner->tier;
    section.strategy = winner->id;
    if (outcome.partial) {
      section.reject_file = winner->reject_file;
      section.diagnostics = "partially applied; rejected hunks in " + winner->reject_file.string() +
                            "\n" + outcome.diagnostic;
    }
  }

  for (const auto& section : result.sections) {
    if (section.state == SectionState::Applied) {
      if (std::find(result.changed_paths.begin(), result.changed_paths.end(), section.path) ==
          result.changed_paths.end()) {
        result.changed_paths.push_back(section.path);
      }
      result.provenance[section.path] = section.tier;
      result.strategies[section.path] = section.strategy;
      if (!section.reject_file.empty()) {
        result.rejects[section.path] = section.reject_file.string();
        result.diagnostics[section.path] = section.diagnostics;
      }
    } else {
      result.diagnostics[section.path] = section.diagnostics;
    }
  }
  log::info("apply finished: " + std::to_string(result.changed_paths.size()) + " of " +
            std::to_string(result.sections.size()) + " section(s) changed");
  return result;
}

std::vector<ApplyStrategy> ApplyEngine::section_ladder(const FileChange& change, size_t index) {
  const std::string stem = section_file_stem(index, normalize_scope_path(change.target_path()));
  const fs::path section_file = patches_dir_ / (stem + ".diff");
  if (!diffgate::data::write_text_file(section_file, with_trailing_newline(change.section_text))) {
    log::error("cannot write " + section_file.string());
    return {};
  }

  auto ladder = git_apply_matrix(ApplyTier::Sectioned, section_file, change.has_ab_prefix, options_.git);
  if (change.is_binary || change.hunks.empty()) {
    return ladder;
  }

  const FileChange zero_context = make_zero_context(change);
  const fs::path zero_context_file = patches_dir_ / (stem + ".zc.diff");
  if (diffgate::data::write_text_file(zero_context_file, with_trailing_newline(zero_context.section_text))) {
    const auto retries = zero_context_strategies(zero_context_file, change.has_ab_prefix, options_.git);
    ladder.insert(ladder.end(), retries.begin(), retries.end());
  } else {
    log::error("cannot write " + zero_context_file.string());
  }

  if (options_.fuzzy_fallback) {
    const auto fuzzy = fuzzy_patch_strategies(section_file, rejects_dir_ / (stem + ".rej"),
                                              change.has_ab_prefix, options_.patch);
    ladder.insert(ladder.end(), fuzzy.begin(), fuzzy.end());
  }
  return ladder;
}

ApplyEngine::AttemptOutcome ApplyEngine::run_attempt(const ApplyStrategy& strategy,
                                                     const std::vector<const FileChange*>& files,
                                                     const std::string& section,
                                                     ApplyResult& result) {
  std::vector<std::string> watched;
  std::vector<std::string> declared;
  for (const FileChange* change : files) {
    const auto candidates = candidate_tree_paths(*change);
    watched.insert(watched.end(), candidates.begin(), candidates.end());
    const auto paths = declared_paths(*change);
    declared.insert(declared.end(), paths.begin(), paths.end());
  }
  if (!strategy.reject_file.empty()) {
    remove_if_exists(strategy.reject_file);
  }

  std::vector<fs::path> excluded{options_.staging_dir};
  excluded.insert(excluded.end(), options_.excluded_dirs.begin(), options_.excluded_dirs.end());
  const TreeSnapshot snapshot = TreeSnapshot::capture(options_.repo_root, watched, excluded);
  CommandSpec spec;
  spec.args = strategy.args;
  spec.cwd = options_.repo_root;
  const CommandResult command = run_command(spec);

  AttemptOutcome out;
  out.changes = snapshot.diff_against_current();
  const std::set<std::string> declared_set(declared.begin(), declared.end());
  std::vector<std::string> stray;
  for (const auto& path : out.changes.all()) {
    if (declared_set.count(path) == 0) stray.push_back(path);
  }
  const bool touched = any_declared_changed(out.changes, declared);

  if (!stray.empty()) {
    out.diagnostic = "wrote outside declared targets: " + join(stray, ", ");
    if (!revert(snapshot, out.changes, strategy, declared)) {
      out.diagnostic += " (revert incomplete)";
    }
  } else if (command.ok()) {
    if (touched) {
      out.success = true;
    } else {
      out.diagnostic = "exited 0 without changing the target";
    }
  } else if (strategy.allows_partial && command.started && command.exit_code == 1 && touched) {
    out.success = true;
    out.partial = true;
    out.diagnostic = command.diagnostic(options_.diagnostic_limit);
  } else {
    out.diagnostic = command.diagnostic(options_.diagnostic_limit);
    if (out.diagnostic.empty()) {
      out.diagnostic = "exit code " + std::to_string(command.exit_code);
    }
    if (!out.changes.empty() && !revert(snapshot, out.changes, strategy, declared)) {
      out.diagnostic += " (revert incomplete)";
    }
  }

  if (!strategy.reject_file.empty() && (!out.partial || is_empty_file(strategy.reject_file))) {
    remove_if_exists(strategy.reject_file);
  }

  ApplyAttempt attempt;
  attempt.tier = strategy.tier;
  attempt.strategy = strategy.id;
  attempt.section = section;
  attempt.success = out.success;
  attempt.partial = out.partial;
  attempt.exit_code = command.exit_code;
  attempt.diagnostic = out.diagnostic;
  result.attempts.push_back(attempt);

  log::info(std::string("[") + tier_name(strategy.tier) + "] " + strategy.id + " (" + section + "): " +
            (out.partial ? "partial" : (out.success ? "ok" : "failed")));
  return out;
}

bool ApplyEngine::revert(const TreeSnapshot& snapshot,
                         const TreeChanges& changes,
                         const ApplyStrategy& strategy,
                         const std::vector<std::string>& declared) {
  std::string error;
  const bool restored = snapshot.restore(changes, error);
  if (strategy.three_way) {
    std::set<std::string> paths(declared.begin(), declared.end());
    for (const auto& path : changes.all()) {
      paths.insert(path);
    }
    CommandSpec reset;
    reset.args = {options_.git, "reset", "-q", "--"};
    reset.args.insert(reset.args.end(), paths.begin(), paths.end());
    reset.cwd = options_.repo_root;
    const CommandResult reset_result = run_command(reset);
    if (!reset_result.ok()) {
      log::warn("index reset after three-way attempt failed: " +
                reset_result.diagnostic(options_.diagnostic_limit));
    }
  }
  log::warn("reverted " + std::to_string(changes.all().size()) + " path(s) after " + strategy.id);
  return restored;
}

} // namespace diffgate
