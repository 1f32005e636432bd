#include "diffgate/path_remap.h"

#include "diffgate/log.h"
#include "diffgate/scope_guard.h"

#include <algorithm>
#include <system_error>
#include <tuple>

namespace diffgate {

namespace fs = std::filesystem;

namespace {
std::vector<std::string> split_segments(const std::string& path) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    const size_t slash = path.find('/', start);
    parts.push_back(path.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  return parts;
}

std::string last_segments(const std::vector<std::string>& parts, size_t count) {
  const size_t first = parts.size() > count ? parts.size() - count : 0;
  std::string out;
  for (size_t i = first; i < parts.size(); ++i) {
    if (i > first) out.push_back('/');
    out += parts[i];
  }
  return out;
}

std::string basename_of(const std::string& path) {
  const size_t slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string rewrite_header_paths(const std::string& section, const std::string& path, bool ab_prefix) {
  const std::string old_side = ab_prefix ? "a/" + path : path;
  const std::string new_side = ab_prefix ? "b/" + path : path;
  std::string out;
  bool in_header = true;
  size_t pos = 0;
  while (pos < section.size()) {
    size_t end = section.find('\n', pos);
    const bool has_newline = end != std::string::npos;
    if (!has_newline) end = section.size();
    std::string line = section.substr(pos, end - pos);
    if (in_header) {
      if (line.rfind("@@", 0) == 0) {
        in_header = false;
      } else if (line.rfind("diff --git ", 0) == 0) {
        line = "diff --git " + old_side + " " + new_side;
      } else if (line.rfind("--- ", 0) == 0 && line != "--- /dev/null") {
        line = "--- " + old_side;
      } else if (line.rfind("+++ ", 0) == 0 && line != "+++ /dev/null") {
        line = "+++ " + new_side;
      }
    }
    out += line;
    if (has_newline) out.push_back('\n');
    pos = end + 1;
  }
  return out;
}
} // namespace

double similarity_ratio(const std::string& a, const std::string& b) {
  const size_t n = a.size();
  const size_t m = b.size();
  if (n + m == 0) return 1.0;
  std::vector<int> next(m + 1, 0);
  std::vector<int> cur(m + 1, 0);
  for (size_t i = n; i-- > 0;) {
    for (size_t j = m; j-- > 0;) {
      if (a[i] == b[j]) {
        cur[j] = next[j + 1] + 1;
      } else {
        cur[j] = std::max(next[j], cur[j + 1]);
      }
    }
    std::swap(cur, next);
  }
  return 2.0 * static_cast<double>(next[0]) / static_cast<double>(n + m);
}

std::optional<std::string> best_match_path(const std::string& target,
                                           const std::vector<std::string>& repo_files) {
  const std::string wanted = normalize_scope_path(target);
  const std::string base = basename_of(wanted);
  const auto target_parts = split_segments(wanted);
  const std::string target_tail = last_segments(target_parts, 4);

  std::optional<std::string> best;
  std::tuple<int, double, int> best_score{-1, 0.0, 0};
  for (const auto& file : repo_files) {
    const std::string candidate = normalize_scope_path(file);
    if (basename_of(candidate) != base) continue;
    const auto parts = split_segments(candidate);
    int suffix = 0;
    for (auto t = target_parts.rbegin(), c = parts.rbegin();
         t != target_parts.rend() && c != parts.rend() && *t == *c; ++t, ++c) {
      ++suffix;
    }
    const std::tuple<int, double, int> score{suffix, similarity_ratio(target_tail, last_segments(parts, 4)),
                                             -static_cast<int>(parts.size())};
    if (!best.has_value() || score > best_score) {
      best = candidate;
      best_score = score;
    }
  }
  if (best.has_value()) {
    return best;
  }

  double best_ratio = 0.0;
  for (const auto& file : repo_files) {
    const std::string candidate = normalize_scope_path(file);
    const double ratio = similarity_ratio(wanted, candidate);
    if (ratio > best_ratio) {
      best_ratio = ratio;
      best = candidate;
    }
  }
  if (best.has_value() && best_ratio >= 0.6) {
    return best;
  }
  return std::nullopt;
}

std::vector<std::string> list_repo_files(const fs::path& root, const std::vector<fs::path>& excluded) {
  std::vector<std::string> out;
  std::vector<fs::path> skip{root / ".git"};
  for (const auto& path : excluded) {
    skip.push_back(path.is_absolute() ? path : root / path);
  }
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    log::warn("remap: cannot list " + root.string() + ": " + ec.message());
    return out;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    if (it->is_directory(ec)) {
      if (std::find(skip.begin(), skip.end(), it->path()) != skip.end()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (it->is_regular_file(ec)) {
      out.push_back(it->path().lexically_relative(root).generic_string());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

RemapResult remap_missing_paths(const PatchDocument& patch,
                                const fs::path& root,
                                const std::vector<std::string>& repo_files) {
  RemapResult result;
  std::string text;
  for (const auto& change : patch.files) {
    const std::string target = normalize_scope_path(change.target_path());
    std::error_code ec;
    if (change.is_new || change.is_rename || fs::exists(root / target, ec)) {
      text += change.section_text;
      continue;
    }
    const auto match = best_match_path(target, repo_files);
    if (!match.has_value()) {
      result.unresolved.push_back(target);
      text += change.section_text;
      continue;
    }
    log::info("remap: " + target + " -> " + *match);
    result.remapped.push_back({target, *match});
    text += rewrite_header_paths(change.section_text, *match, change.has_ab_prefix);
  }
  if (result.remapped.empty()) {
    result.patch = patch;
  } else {
    result.patch = parse_patch(text);
  }
  return result;
}

} // namespace diffgate
