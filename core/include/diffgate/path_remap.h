#pragma once

#include "diffgate/patch_document.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace diffgate {

struct PathRemap {
  std::string from;
  std::string to;
};

struct RemapResult {
  PatchDocument patch;
  std::vector<PathRemap> remapped;
  // Missing targets with no acceptable match; their sections are kept as written.
  std::vector<std::string> unresolved;
};

// 2 * LCS / (|a| + |b|); 1.0 for two empty strings.
double similarity_ratio(const std::string& a, const std::string& b);

// Same-basename files ranked by shared trailing segments, then similarity of the last
// four segments, then shorter paths; otherwise the most similar file scoring >= 0.6.
std::optional<std::string> best_match_path(const std::string& target,
                                           const std::vector<std::string>& repo_files);

// Regular files under root, relative and sorted, skipping .git and the excluded directories.
std::vector<std::string> list_repo_files(const std::filesystem::path& root,
                                         const std::vector<std::filesystem::path>& excluded = {});

// Points sections whose target is missing from root at the best-matching repo file.
// New files and renames are left alone.
RemapResult remap_missing_paths(const PatchDocument& patch,
                                const std::filesystem::path& root,
                                const std::vector<std::string>& repo_files);

} // namespace diffgate
