#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace diffgate {

enum class ApplyTier {
  WholePatch,   // S1
  Sectioned,    // S2
  ZeroContext,  // S3
  FuzzyPatch    // S4
};

const char* tier_name(ApplyTier tier);

struct ApplyStrategy {
  ApplyTier tier = ApplyTier::WholePatch;
  // Command line without the patch file, e.g. "git apply -3 -p1 --whitespace=fix".
  std::string id;
  std::vector<std::string> args;
  int strip_depth = 1;
  bool three_way = false;
  // patch(1) exit code 1 with the target changed counts as a partial success.
  bool allows_partial = false;
  std::filesystem::path reject_file;
};

// [1, 0] for a/ b/ prefixed diffs, [0, 1] otherwise.
std::vector<int> strip_depth_order(bool uses_ab_prefix);

// The tolerance flag sets tried after the plain three-way attempt, in order.
const std::vector<std::vector<std::string>>& git_apply_flag_sets();

// S1/S2 matrix: per depth, "-3" then the flag sets without "-3"; all with --whitespace=fix.
std::vector<ApplyStrategy> git_apply_matrix(ApplyTier tier,
                                            const std::filesystem::path& patch_file,
                                            bool uses_ab_prefix,
                                            const std::string& git = "git");

// S3: zero-context rewrite retried with --unidiff-zero --ignore-whitespace at both depths.
std::vector<ApplyStrategy> zero_context_strategies(const std::filesystem::path& zero_context_file,
                                                   bool uses_ab_prefix,
                                                   const std::string& git = "git");

// S4: patch(1) without backups, unplaceable hunks written to reject_file.
std::vector<ApplyStrategy> fuzzy_patch_strategies(const std::filesystem::path& patch_file,
                                                  const std::filesystem::path& reject_file,
                                                  bool uses_ab_prefix,
                                                  const std::string& patch = "patch");

// Runs attempt(strategy) in order and stops at the first that returns true.
template <typename Fn>
const ApplyStrategy* first_success(const std::vector<ApplyStrategy>& strategies, Fn&& attempt) {
  for (const auto& strategy : strategies) {
    if (attempt(strategy)) {
      return &strategy;
    }
  }
  return nullptr;
}

} // namespace diffgate
