#pragma once

#include "diffgate/patch_document.h"
#include "diffgate/scope_config.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace diffgate {

struct RejectedPath {
  std::string path;
  std::string reason;
};

struct PathFilterResult {
  std::vector<std::string> allowed_create;
  std::vector<std::string> allowed_modify;
  std::vector<RejectedPath> rejected;
};

struct PatchValidation {
  bool ok = false;
  std::vector<std::string> rejected_targets;
  // Targets matching the "tests" globs; informational only.
  std::vector<std::string> test_targets;
};

// Shell-style wildcard match where '*' also crosses '/'.
bool glob_match(std::string_view pattern, std::string_view path);

// Forward slashes, no leading "./".
std::string normalize_scope_path(std::string_view path);

// Relative, non-empty and free of ".." segments.
bool is_safe_rel_path(std::string_view path);

class ScopeGuard {
 public:
  // config must outlive the guard. root is the working tree used to tell directories from files.
  ScopeGuard(const ScopeConfig& config, std::filesystem::path root);

  const ScopeConfig& config() const { return config_; }
  const std::filesystem::path& root() const { return root_; }

  PathFilterResult filter_paths(const std::vector<std::string>& create_candidates,
                                const std::vector<std::string>& modify_candidates) const;

  PatchValidation validate_patch(const PatchDocument& patch) const;

  // Matches create ∪ modify and is a safe relative path.
  bool is_authorized(std::string_view path) const;
  bool is_test_path(std::string_view path) const;

 private:
  bool is_directory_candidate(const std::string& path) const;

  const ScopeConfig& config_;
  std::filesystem::path root_;
};

} // namespace diffgate
