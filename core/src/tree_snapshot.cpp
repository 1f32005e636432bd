#include "diffgate/tree_snapshot.h"

#include "diffgate/log.h"
#include "diffgate_data/serialization.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace diffgate {

namespace fs = std::filesystem;

namespace {
struct ScanResult {
  std::map<std::string, SnapshotEntry> entries;
  std::set<std::string> dirs;
};

fs::path normalize_abs(const fs::path& path) {
  std::error_code ec;
  auto out = fs::weakly_canonical(fs::absolute(path, ec), ec);
  if (ec) {
    return fs::absolute(path).lexically_normal();
  }
  return out;
}

bool path_within(const fs::path& path, const fs::path& base) {
  auto b = base.begin();
  auto p = path.begin();
  for (; b != base.end(); ++b, ++p) {
    if (b->empty()) continue;
    if (p == path.end() || *p != *b) return false;
  }
  return true;
}
} // namespace

uint64_t fnv1a_64(const std::string& data) {
  uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : data) {
    hash ^= static_cast<uint64_t>(c);
    hash *= 1099511628211ull;
  }
  return hash;
}

std::string to_hex(uint64_t value) {
  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << value;
  return out.str();
}

std::vector<std::string> TreeChanges::all() const {
  std::vector<std::string> out;
  out.reserve(added.size() + removed.size() + modified.size());
  out.insert(out.end(), added.begin(), added.end());
  out.insert(out.end(), removed.begin(), removed.end());
  out.insert(out.end(), modified.begin(), modified.end());
  return out;
}

bool TreeChanges::contains(const std::string& path) const {
  return std::find(added.begin(), added.end(), path) != added.end() ||
         std::find(removed.begin(), removed.end(), path) != removed.end() ||
         std::find(modified.begin(), modified.end(), path) != modified.end();
}

bool TreeSnapshot::is_excluded(const fs::path& absolute) const {
  for (const auto& excluded : excluded_) {
    if (path_within(absolute, excluded)) return true;
  }
  return false;
}

TreeSnapshot TreeSnapshot::capture(const fs::path& root,
                                   const std::vector<std::string>& watched,
                                   const std::vector<fs::path>& excluded) {
  TreeSnapshot snap;
  snap.root_ = normalize_abs(root);
  snap.excluded_.push_back(snap.root_ / ".git");
  for (const auto& path : excluded) {
    snap.excluded_.push_back(normalize_abs(path.is_absolute() ? path : snap.root_ / path));
  }
  snap.watched_.insert(watched.begin(), watched.end());

  std::error_code ec;
  fs::recursive_directory_iterator it(snap.root_, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    log::warn("snapshot: cannot walk " + snap.root_.string() + ": " + ec.message());
    return snap;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      log::warn("snapshot: walk error: " + ec.message());
      break;
    }
    const fs::path abs = it->path();
    if (snap.is_excluded(abs)) {
      if (it->is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    const std::string rel = abs.lexically_relative(snap.root_).generic_string();
    if (it->is_directory(ec)) {
      snap.dirs_.insert(rel);
      continue;
    }
    if (!it->is_regular_file(ec)) continue;
    SnapshotEntry entry;
    entry.size = static_cast<uint64_t>(it->file_size(ec));
    entry.mtime = it->last_write_time(ec);
    entry.perms = it->status(ec).permissions();
    if (snap.watched_.count(rel) > 0) {
      std::string contents;
      std::string error;
      if (diffgate::data::read_text_file(abs, contents, error)) {
        entry.hash = fnv1a_64(contents);
        snap.contents_[rel] = std::move(contents);
      } else {
        log::warn("snapshot: " + error);
      }
    }
    snap.entries_[rel] = entry;
  }
  return snap;
}

TreeChanges TreeSnapshot::diff_against_current() const {
  const TreeSnapshot now = capture(root_, std::vector<std::string>(watched_.begin(), watched_.end()), excluded_);
  TreeChanges changes;
  for (const auto& [path, before] : entries_) {
    const auto it = now.entries_.find(path);
    if (it == now.entries_.end()) {
      changes.removed.push_back(path);
      continue;
    }
    const auto& after = it->second;
    // Watched paths compare by content so a restored file does not count as changed.
    // A mode-only patch changes nothing but the permissions.
    if (before.perms != after.perms) {
      changes.modified.push_back(path);
    } else if (before.hash.has_value() && after.hash.has_value()) {
      if (*before.hash != *after.hash) changes.modified.push_back(path);
    } else if (before.size != after.size || before.mtime != after.mtime) {
      changes.modified.push_back(path);
    }
  }
  for (const auto& [path, after] : now.entries_) {
    (void)after;
    if (entries_.find(path) == entries_.end()) {
      changes.added.push_back(path);
    }
  }
  return changes;
}

void TreeSnapshot::remove_created_dirs(const fs::path& rel) const {
  fs::path dir = rel.parent_path();
  while (!dir.empty() && dirs_.count(dir.generic_string()) == 0) {
    std::error_code ec;
    if (!fs::is_empty(root_ / dir, ec) || ec) break;
    fs::remove(root_ / dir, ec);
    if (ec) break;
    dir = dir.parent_path();
  }
}

bool TreeSnapshot::restore(const TreeChanges& changes, std::string& error) const {
  std::vector<std::string> failed;
  for (const auto& path : changes.all()) {
    const fs::path abs = root_ / path;
    std::error_code ec;
    if (entries_.find(path) == entries_.end()) {
      fs::remove(abs, ec);
      if (ec) {
        failed.push_back(path);
        continue;
      }
      remove_created_dirs(fs::path(path));
      continue;
    }
    const auto content = contents_.find(path);
    if (content == contents_.end()) {
      failed.push_back(path);
      continue;
    }
    if (!diffgate::data::write_text_file(abs, content->second)) {
      failed.push_back(path);
      continue;
    }
    const auto& before = entries_.at(path);
    if (before.perms != fs::perms::unknown) {
      fs::permissions(abs, before.perms, fs::perm_options::replace, ec);
      if (ec) {
        log::warn("snapshot: cannot restore permissions of " + path + ": " + ec.message());
        failed.push_back(path);
      }
    }
  }
  if (!failed.empty()) {
    error = "could not restore:";
    for (const auto& path : failed) {
      error += " " + path;
    }
    log::error("snapshot " + error);
    return false;
  }
  return true;
}

} // namespace diffgate
