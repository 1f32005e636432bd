#pragma once

#include "diffgate/apply_strategy.h"
#include "diffgate/patch_document.h"
#include "diffgate/scope_guard.h"
#include "diffgate/tree_snapshot.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace diffgate {

struct ApplyEngineOptions {
  std::filesystem::path repo_root;
  // Per-run directory; section files go to patches/, reject sidecars to rejects/.
  std::filesystem::path staging_dir;
  // Further directories whose writes are not the patch's doing (logs, audit trail).
  std::vector<std::filesystem::path> excluded_dirs;
  std::string git = "git";
  std::string patch = "patch";
  bool fuzzy_fallback = true;
  size_t diagnostic_limit = 1600;
};

struct ApplyAttempt {
  ApplyTier tier = ApplyTier::WholePatch;
  std::string strategy;
  // Target of the section, or "*" for a whole-patch attempt.
  std::string section;
  bool success = false;
  bool partial = false;
  int exit_code = -1;
  std::string diagnostic;
};

enum class SectionState {
  Pending,
  Applied,
  Unchanged
};

struct SectionOutcome {
  std::string path;
  SectionState state = SectionState::Pending;
  ApplyTier tier = ApplyTier::WholePatch;
  std::string strategy;
  std::string diagnostics;
  std::filesystem::path reject_file;
};

struct ApplyResult {
  // False when the scope guard refused the patch; nothing was attempted then.
  bool ok = false;
  std::vector<std::string> rejected_targets;
  // In the order their sections appear in the diff.
  std::vector<std::string> changed_paths;
  std::map<std::string, ApplyTier> provenance;
  std::map<std::string, std::string> strategies;
  std::map<std::string, std::string> diagnostics;
  std::map<std::string, std::string> rejects;
  std::vector<SectionOutcome> sections;
  std::vector<ApplyAttempt> attempts;
};

class ApplyEngine {
 public:
  ApplyEngine(const ScopeGuard& guard, ApplyEngineOptions options);

  ApplyResult apply(const PatchDocument& patch);

  const ApplyEngineOptions& options() const { return options_; }

 private:
  struct AttemptOutcome {
    bool success = false;
    bool partial = false;
    TreeChanges changes;
    std::string diagnostic;
  };

  AttemptOutcome run_attempt(const ApplyStrategy& strategy,
                             const std::vector<const FileChange*>& files,
                             const std::string& section,
                             ApplyResult& result);
  bool revert(const TreeSnapshot& snapshot,
              const TreeChanges& changes,
              const ApplyStrategy& strategy,
              const std::vector<std::string>& declared);
  std::vector<ApplyStrategy> section_ladder(const FileChange& change, size_t index);

  const ScopeGuard& guard_;
  ApplyEngineOptions options_;
  std::filesystem::path patches_dir_;
  std::filesystem::path rejects_dir_;
};

} // namespace diffgate
