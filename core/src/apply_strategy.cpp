#include "diffgate/apply_strategy.h"

#include "diffgate/subprocess.h"

namespace diffgate {

namespace {
ApplyStrategy make_git_apply(ApplyTier tier,
                             const std::filesystem::path& patch_file,
                             int depth,
                             bool three_way,
                             const std::vector<std::string>& flags,
                             const std::string& git) {
  ApplyStrategy strategy;
  strategy.tier = tier;
  strategy.strip_depth = depth;
  strategy.three_way = three_way;
  strategy.args = {git, "apply"};
  if (three_way) {
    strategy.args.push_back("-3");
  }
  strategy.args.push_back("-p" + std::to_string(depth));
  strategy.args.push_back("--whitespace=fix");
  strategy.args.insert(strategy.args.end(), flags.begin(), flags.end());
  strategy.id = describe_command(strategy.args);
  strategy.args.push_back(patch_file.string());
  return strategy;
}
} // namespace

const char* tier_name(ApplyTier tier) {
  switch (tier) {
    case ApplyTier::WholePatch:
      return "S1";
    case ApplyTier::Sectioned:
      return "S2";
    case ApplyTier::ZeroContext:
      return "S3";
    case ApplyTier::FuzzyPatch:
      return "S4";
  }
  return "S?";
}

std::vector<int> strip_depth_order(bool uses_ab_prefix) {
  if (uses_ab_prefix) {
    return {1, 0};
  }
  return {0, 1};
}

const std::vector<std::vector<std::string>>& git_apply_flag_sets() {
  static const std::vector<std::vector<std::string>> kFlagSets = {
      {},
      {"--ignore-whitespace"},
      {"--inaccurate-eof"},
      {"--unidiff-zero"},
      {"--ignore-whitespace", "--inaccurate-eof"},
      {"--reject", "--ignore-whitespace"},
      {"--reject", "--unidiff-zero"},
  };
  return kFlagSets;
}

std::vector<ApplyStrategy> git_apply_matrix(ApplyTier tier,
                                            const std::filesystem::path& patch_file,
                                            bool uses_ab_prefix,
                                            const std::string& git) {
  std::vector<ApplyStrategy> out;
  for (const int depth : strip_depth_order(uses_ab_prefix)) {
    out.push_back(make_git_apply(tier, patch_file, depth, true, {}, git));
    for (const auto& flags : git_apply_flag_sets()) {
      out.push_back(make_git_apply(tier, patch_file, depth, false, flags, git));
    }
  }
  return out;
}

std::vector<ApplyStrategy> zero_context_strategies(const std::filesystem::path& zero_context_file,
                                                   bool uses_ab_prefix,
                                                   const std::string& git) {
  std::vector<ApplyStrategy> out;
  for (const int depth : strip_depth_order(uses_ab_prefix)) {
    out.push_back(make_git_apply(ApplyTier::ZeroContext, zero_context_file, depth, false,
                                 {"--unidiff-zero", "--ignore-whitespace"}, git));
  }
  return out;
}

std::vector<ApplyStrategy> fuzzy_patch_strategies(const std::filesystem::path& patch_file,
                                                  const std::filesystem::path& reject_file,
                                                  bool uses_ab_prefix,
                                                  const std::string& patch) {
  std::vector<ApplyStrategy> out;
  for (const int depth : strip_depth_order(uses_ab_prefix)) {
    ApplyStrategy strategy;
    strategy.tier = ApplyTier::FuzzyPatch;
    strategy.strip_depth = depth;
    strategy.allows_partial = true;
    strategy.reject_file = reject_file;
    strategy.args = {patch, "-p" + std::to_string(depth), "-f", "-N", "--follow-symlinks",
                     "--no-backup-if-mismatch"};
    strategy.id = describe_command(strategy.args);
    strategy.args.insert(strategy.args.end(), {"-r", reject_file.string(), "-i", patch_file.string()});
    out.push_back(std::move(strategy));
  }
  return out;
}

} // namespace diffgate
