#include "diffgate/paths.h"

#include "diffgate/log.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <system_error>

namespace diffgate {

namespace fs = std::filesystem;

namespace {
bool has_git_dir(const fs::path& dir) {
  std::error_code ec;
  return fs::exists(dir / ".git", ec);
}

fs::path find_root_from(const fs::path& start) {
  fs::path cur = start;
  for (int i = 0; i < 32; ++i) {
    if (has_git_dir(cur)) {
      return cur;
    }
    if (cur.has_parent_path() && cur.parent_path() != cur) {
      cur = cur.parent_path();
    } else {
      break;
    }
  }
  return start;
}

fs::path absolute_or(const fs::path& path, const fs::path& base) {
  if (path.is_absolute()) return path.lexically_normal();
  return (base / path).lexically_normal();
}
} // namespace

ResolvedPaths resolve_paths(const std::optional<fs::path>& repo_override,
                            const std::string& staging_override) {
  ResolvedPaths out;
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (const char* env_root = std::getenv("DIFFGATE_ROOT")) {
    out.root = absolute_or(fs::path(env_root), cwd);
  } else if (repo_override.has_value()) {
    out.root = absolute_or(*repo_override, cwd);
  } else {
    out.root = find_root_from(cwd);
  }

  // A worktree or submodule has a .git file rather than a directory.
  out.is_git_checkout = fs::is_directory(out.root / ".git", ec);
  if (!staging_override.empty()) {
    out.staging_root = absolute_or(fs::path(staging_override), out.root);
  } else if (out.is_git_checkout) {
    out.staging_root = out.root / ".git" / "diffgate";
  } else {
    out.staging_root = out.root / "build" / "diffgate";
  }
  out.runs_dir = out.staging_root / "runs";
  out.logs_dir = out.staging_root / "logs";
  out.audit_log = out.staging_root / "audit.log";
  out.last_results = out.staging_root / "last_results.json";

  if (!fs::is_directory(out.root, ec)) {
    log::warn(std::string("repository root not found: ") + out.root.string());
  }
  return out;
}

std::string now_iso() {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return std::string(buf);
}

std::string make_run_id() {
  std::string id = now_iso();
  for (auto& c : id) {
    if (c == ':' || c == 'T') c = '_';
  }
  return id;
}

std::optional<fs::path> make_run_dir(const ResolvedPaths& paths, const std::string& run_id, std::string& error) {
  std::error_code ec;
  fs::path dir = paths.runs_dir / run_id;
  for (int suffix = 1; fs::exists(dir, ec) && suffix < 1000; ++suffix) {
    dir = paths.runs_dir / (run_id + "_" + std::to_string(suffix));
  }
  fs::create_directories(dir, ec);
  if (ec) {
    error = "cannot create run directory " + dir.string() + ": " + ec.message();
    return std::nullopt;
  }
  return dir;
}

} // namespace diffgate
