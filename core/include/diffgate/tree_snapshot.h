#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace diffgate {

struct SnapshotEntry {
  uint64_t size = 0;
  std::filesystem::file_time_type mtime{};
  std::filesystem::perms perms = std::filesystem::perms::unknown;
  // Set for watched paths only.
  std::optional<uint64_t> hash;
};

struct TreeChanges {
  std::vector<std::string> added;
  std::vector<std::string> removed;
  std::vector<std::string> modified;

  bool empty() const { return added.empty() && removed.empty() && modified.empty(); }
  std::vector<std::string> all() const;
  bool contains(const std::string& path) const;
};

// Pre-attempt picture of a working tree. Every file is recorded by size, mtime and
// permissions; watched paths additionally keep a content hash and their bytes so they
// can be restored.
class TreeSnapshot {
 public:
  static TreeSnapshot capture(const std::filesystem::path& root,
                              const std::vector<std::string>& watched,
                              const std::vector<std::filesystem::path>& excluded);

  // Compares the tree as it is now against this snapshot.
  TreeChanges diff_against_current() const;

  // Puts changed paths back: restores watched contents and permissions, deletes files
  // that did not exist before. Returns false with the unrecoverable paths listed in error.
  bool restore(const TreeChanges& changes, std::string& error) const;

  const std::filesystem::path& root() const { return root_; }

 private:
  bool is_excluded(const std::filesystem::path& absolute) const;
  void remove_created_dirs(const std::filesystem::path& rel) const;

  std::filesystem::path root_;
  std::vector<std::filesystem::path> excluded_;
  std::set<std::string> watched_;
  std::set<std::string> dirs_;
  std::map<std::string, SnapshotEntry> entries_;
  std::map<std::string, std::string> contents_;
};

uint64_t fnv1a_64(const std::string& data);
std::string to_hex(uint64_t value);

} // namespace diffgate
