#include "diffgate/scope_guard.h"

#include "diffgate/log.h"

#include <algorithm>
#include <fnmatch.h>
#include <system_error>

namespace diffgate {

namespace {
bool matches_any(const std::vector<std::string>& patterns, std::string_view path) {
  for (const auto& pattern : patterns) {
    if (glob_match(pattern, path)) return true;
  }
  return false;
}

void push_unique(std::vector<std::string>& out, const std::string& path) {
  if (std::find(out.begin(), out.end(), path) == out.end()) {
    out.push_back(path);
  }
}
} // namespace

bool glob_match(std::string_view pattern, std::string_view path) {
  const std::string p = normalize_scope_path(pattern);
  const std::string s = normalize_scope_path(path);
  // No FNM_PATHNAME: '*' is allowed to cross directory separators.
  return ::fnmatch(p.c_str(), s.c_str(), 0) == 0;
}

std::string normalize_scope_path(std::string_view path) {
  std::string out(path);
  std::replace(out.begin(), out.end(), '\\', '/');
  while (out.size() >= 2 && out[0] == '.' && out[1] == '/') {
    out.erase(0, 2);
  }
  return out;
}

bool is_safe_rel_path(std::string_view path) {
  const std::string norm = normalize_scope_path(path);
  if (norm.empty() || norm.front() == '/') return false;
  if (norm.size() >= 2 && norm[1] == ':') return false;
  size_t pos = 0;
  while (pos <= norm.size()) {
    size_t end = norm.find('/', pos);
    if (end == std::string::npos) end = norm.size();
    if (norm.compare(pos, end - pos, "..") == 0 && end - pos == 2) return false;
    pos = end + 1;
  }
  return true;
}

ScopeGuard::ScopeGuard(const ScopeConfig& config, std::filesystem::path root)
    : config_(config), root_(std::move(root)) {}

bool ScopeGuard::is_directory_candidate(const std::string& path) const {
  if (!path.empty() && path.back() == '/') return true;
  if (root_.empty()) return false;
  std::error_code ec;
  return std::filesystem::is_directory(root_ / path, ec);
}

PathFilterResult ScopeGuard::filter_paths(const std::vector<std::string>& create_candidates,
                                          const std::vector<std::string>& modify_candidates) const {
  PathFilterResult result;
  for (const auto& raw : create_candidates) {
    const std::string path = normalize_scope_path(raw);
    if (!is_safe_rel_path(path)) {
      result.rejected.push_back({path, "unsafe path"});
    } else if (!matches_any(config_.create, path)) {
      result.rejected.push_back({path, "not in create scope"});
    } else {
      push_unique(result.allowed_create, path);
    }
  }
  for (const auto& raw : modify_candidates) {
    const std::string path = normalize_scope_path(raw);
    if (!is_safe_rel_path(path)) {
      result.rejected.push_back({path, "unsafe path"});
    } else if (is_directory_candidate(path) && !config_.dir_rewrite_allowed) {
      result.rejected.push_back({path, "directory rewrite not allowed"});
    } else if (!matches_any(config_.modify, path)) {
      result.rejected.push_back({path, "not in modify scope"});
    } else {
      push_unique(result.allowed_modify, path);
    }
  }
  return result;
}

bool ScopeGuard::is_authorized(std::string_view path) const {
  if (!is_safe_rel_path(path)) return false;
  return matches_any(config_.create, path) || matches_any(config_.modify, path);
}

bool ScopeGuard::is_test_path(std::string_view path) const {
  return matches_any(config_.tests, path);
}

PatchValidation ScopeGuard::validate_patch(const PatchDocument& patch) const {
  PatchValidation result;
  for (const auto& change : patch.files) {
    const auto targets = declared_paths(change);
    if (targets.empty()) {
      push_unique(result.rejected_targets, change.new_path.empty() ? "<unnamed>" : change.new_path);
      continue;
    }
    for (const auto& target : targets) {
      const std::string path = normalize_scope_path(target);
      if (!is_authorized(path)) {
        push_unique(result.rejected_targets, path);
      } else if (is_test_path(path)) {
        push_unique(result.test_targets, path);
      }
    }
  }
  if (result.rejected_targets.empty()) {
    result.ok = true;
  } else if (config_.strict_mode) {
    result.ok = false;
    log::warn("patch rejected under strict mode: " + std::to_string(result.rejected_targets.size()) +
              " unauthorized target(s)");
  } else {
    result.ok = true;
    for (const auto& path : result.rejected_targets) {
      log::warn("out-of-scope target allowed (non-strict): " + path);
    }
  }
  return result;
}

} // namespace diffgate
