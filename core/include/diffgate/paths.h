#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace diffgate {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path staging_root;
  std::filesystem::path runs_dir;
  std::filesystem::path logs_dir;
  std::filesystem::path audit_log;
  std::filesystem::path last_results;
  bool is_git_checkout = false;
};

// Root: DIFFGATE_ROOT, else repo_override, else the nearest ancestor of the working
// directory holding .git. Staging: staging_override, else <root>/.git/diffgate for a
// git checkout and <root>/build/diffgate otherwise.
ResolvedPaths resolve_paths(const std::optional<std::filesystem::path>& repo_override,
                            const std::string& staging_override = {});

std::string now_iso();
std::string make_run_id();

// Creates runs/<run_id> (suffixed when the id is taken) and returns it.
std::optional<std::filesystem::path> make_run_dir(const ResolvedPaths& paths,
                                                  const std::string& run_id,
                                                  std::string& error);

} // namespace diffgate
