#include "diffgate/apply_strategy.h"
#include "diffgate/config.h"
#include "diffgate/log.h"
#include "diffgate/patch_document.h"
#include "diffgate/path_remap.h"
#include "diffgate/pipeline.h"
#include "diffgate/sanitizer.h"
#include "diffgate/scope_config.h"
#include "diffgate/scope_guard.h"
#include "diffgate/tree_snapshot.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;
  out << contents;
  return true;
}

std::set<std::string> as_set(const std::vector<std::string>& items) {
  return std::set<std::string>(items.begin(), items.end());
}

diffgate::ScopeConfig make_scope(std::vector<std::string> modify,
                                 std::vector<std::string> create = {},
                                 bool strict = true) {
  diffgate::ScopeConfig cfg;
  cfg.modify = std::move(modify);
  cfg.create = std::move(create);
  cfg.strict_mode = strict;
  return cfg;
}

std::string one_file_diff(const std::string& path) {
  return "diff --git a/" + path + " b/" + path + "\n"
         "--- a/" + path + "\n"
         "+++ b/" + path + "\n"
         "@@ -1 +1 @@\n"
         "-old\n"
         "+new\n";
}
} // namespace

int main() {
  const fs::path temp_root = fs::temp_directory_path() / ("diffgate_tests_" + std::to_string(::getpid()));
  fs::create_directories(temp_root);
  diffgate::log::init("diffgate_tests", temp_root / "logs");

  int failures = 0;

  // Test: sanitize strips prose and fences around a model answer.
  {
    const std::string raw =
        "Here is the fix:\n```diff\ndiff --git a/x.txt b/x.txt\nindex 111..222 100644\n--- a/x.txt\n+++ b/x.txt\n"
        "@@ -1,1 +1,1 @@\n-old\n+new\n```\nThanks!";
    const std::string expected =
        "diff --git a/x.txt b/x.txt\nindex 111..222 100644\n--- a/x.txt\n+++ b/x.txt\n@@ -1,1 +1,1 @@\n-old\n+new\n";
    const auto sanitized = diffgate::sanitize_patch(raw);
    if (!sanitized.has_value() || *sanitized != expected) {
      std::cerr << "sanitize did not recover the fenced diff\n";
      ++failures;
    }
  }

  // Test: sanitize is idempotent.
  {
    const std::vector<std::string> inputs = {
        "Intro\r\n```\r\ndiff --git a/a.c b/a.c\r\n--- a/a.c\r\n+++ b/a.c\r\n@@ -1,2 +1,2 @@\r\n x\r\n-y\r\n+z\r\n```\r\n",
        "1.\ndiff --git a/a b/a\n--- a/a\n+++ b/a\n@@ -1 +1 @@\n-a\n+b\n2.:\n\xE2\x80\x94\ndiff --git a/b b/b\n"
        "--- a/b\n+++ b/b\n@@ -1 +1 @@\n-c\n+d\n",
        "text before\ndiff --git a/q b/q\nnew file mode 100644\n--- /dev/null\n+++ b/q\n@@ -0,0 +1 @@\n+hi\n"
        "\\ No newline at end of file\ntrailing prose\n",
    };
    for (const auto& input : inputs) {
      const auto once = diffgate::sanitize_patch(input);
      if (!once.has_value()) {
        std::cerr << "sanitize lost a diff\n";
        ++failures;
        continue;
      }
      const auto twice = diffgate::sanitize_patch(*once);
      if (!twice.has_value() || *twice != *once) {
        std::cerr << "sanitize is not idempotent\n";
        ++failures;
      }
      if (once->find('\r') != std::string::npos || once->back() != '\n') {
        std::cerr << "sanitize left CR or missing trailing newline\n";
        ++failures;
      }
    }
  }

  // Test: no header means no patch; list artifacts and prose are dropped, "-" removals kept.
  {
    if (diffgate::sanitize_patch("Sorry, I cannot produce a diff.").has_value()) {
      std::cerr << "sanitize invented a patch\n";
      ++failures;
    }
    const std::string raw =
        "diff --git a/a b/a\n--- a/a\n+++ b/a\n@@ -1,2 +1,1 @@\n-\n x\n3.\nsome prose\n\xE2\x80\x93\n";
    const auto sanitized = diffgate::sanitize_patch(raw);
    const std::string expected = "diff --git a/a b/a\n--- a/a\n+++ b/a\n@@ -1,2 +1,1 @@\n-\n x\n";
    if (!sanitized.has_value() || *sanitized != expected) {
      std::cerr << "sanitize artifact filtering wrong\n";
      ++failures;
    }
    if (diffgate::is_valid_patch_line("") || !diffgate::is_valid_patch_line("GIT binary patch") ||
        diffgate::is_valid_patch_line("Thanks!")) {
      std::cerr << "patch line grammar wrong\n";
      ++failures;
    }
  }

  // Test: legacy and preferred descriptors parse to the same config.
  {
    const json preferred = json::parse(R"({"scope":{"modify":["src/*.cpp"],"create":["src/new_*.cpp"],
      "tests":["tests/*"],"strict_mode":false,"dir_rewrite_allowed":true}})");
    const json legacy = json::parse(R"({"task":{"allowed_targets":{"modify":["src/*.cpp"],"create":["src/new_*.cpp"],
      "tests":["tests/*"]},"execution":{"strict_mode":false,"dir_rewrite_allowed":true}}})");
    const auto a = diffgate::parse_scope_config(preferred);
    const auto b = diffgate::parse_scope_config(legacy);
    if (!a.ok() || !b.ok()) {
      std::cerr << "descriptor parse errors: " << diffgate::format_scope_errors(a.errors)
                << diffgate::format_scope_errors(b.errors);
      ++failures;
    }
    if (diffgate::scope_config_to_json(a.config) != diffgate::scope_config_to_json(b.config)) {
      std::cerr << "legacy and preferred descriptors differ\n";
      ++failures;
    }
    if (a.shape != diffgate::ScopeDescriptorShape::Scope || b.shape != diffgate::ScopeDescriptorShape::Legacy) {
      std::cerr << "descriptor shape detection wrong\n";
      ++failures;
    }
  }

  // Test: preferred shape wins when both are present.
  {
    const json both = json::parse(R"({"scope":{"modify":["a/*"]},"allowed_targets":{"modify":["b/*"]}})");
    const auto result = diffgate::parse_scope_config(both);
    if (result.config.modify != std::vector<std::string>{"a/*"} || result.warnings.empty()) {
      std::cerr << "scope precedence wrong\n";
      ++failures;
    }
  }

  // Test: missing or malformed descriptors keep safe defaults and report errors.
  {
    const auto empty = diffgate::parse_scope_config(json::object());
    if (empty.ok() || !empty.config.strict_mode || empty.config.dir_rewrite_allowed ||
        !empty.config.modify.empty() || !empty.config.create.empty()) {
      std::cerr << "empty descriptor should deny everything with an error\n";
      ++failures;
    }
    const json bad = json::parse(R"({"scope":{"modify":["ok/*", 7, ""],"strict_mode":"no","create":"x"}})");
    const auto result = diffgate::parse_scope_config(bad);
    std::set<std::string> keypaths;
    for (const auto& error : result.errors) {
      keypaths.insert(error.keypath);
    }
    const std::set<std::string> expected = {"scope.modify[1]", "scope.modify[2]", "scope.strict_mode", "scope.create"};
    if (keypaths != expected) {
      std::cerr << "malformed descriptor errors wrong:\n" << diffgate::format_scope_errors(result.errors);
      ++failures;
    }
    if (!result.config.strict_mode || result.config.modify != std::vector<std::string>{"ok/*"} ||
        !result.config.create.empty()) {
      std::cerr << "malformed descriptor did not keep safe defaults\n";
      ++failures;
    }
  }

#if DIFFGATE_ENABLE_DATA_YAML
  // Test: YAML descriptors load through the same validator.
  {
    const fs::path path = temp_root / "scope.yaml";
    write_text(path,
               "scope:\n"
               "  modify: [\"src/*.txt\"]\n"
               "  tests:\n"
               "    - \"tests/*\"\n"
               "  strict_mode: true\n"
               "  dir_rewrite_allowed: false\n");
    const auto result = diffgate::load_scope_config(path);
    if (!result.ok() || result.config.modify != std::vector<std::string>{"src/*.txt"} ||
        result.config.tests != std::vector<std::string>{"tests/*"} || !result.config.strict_mode) {
      std::cerr << "yaml descriptor not loaded\n";
      ++failures;
    }
  }
#endif

  // Test: a missing descriptor file denies everything.
  {
    const auto result = diffgate::load_scope_config(temp_root / "missing.json");
    if (result.ok() || !result.config.modify.empty()) {
      std::cerr << "missing descriptor should error\n";
      ++failures;
    }
  }

  // Test: strict mode accepts a fully authorized diff.
  {
    const auto cfg = make_scope({"src/*.txt"}, {"docs/*"});
    const diffgate::ScopeGuard guard(cfg, {});
    const auto patch = diffgate::parse_patch(one_file_diff("src/a.txt") + one_file_diff("docs/guide.md"));
    const auto validation = guard.validate_patch(patch);
    if (!validation.ok || !validation.rejected_targets.empty()) {
      std::cerr << "authorized diff rejected\n";
      ++failures;
    }
  }

  // Test: strict mode rejects exactly the offending targets.
  {
    const auto cfg = make_scope({"src/*.txt"});
    const diffgate::ScopeGuard guard(cfg, {});
    const auto patch = diffgate::parse_patch(one_file_diff("src/a.txt") + one_file_diff("lib/b.txt") +
                                             one_file_diff("src/c.txt") + one_file_diff("README.md"));
    const auto validation = guard.validate_patch(patch);
    if (validation.ok || as_set(validation.rejected_targets) != std::set<std::string>{"lib/b.txt", "README.md"}) {
      std::cerr << "strict rejection set wrong\n";
      ++failures;
    }
  }

  // Test: non-strict mode reports but does not block.
  {
    const auto cfg = make_scope({"src/*.txt"}, {}, false);
    const diffgate::ScopeGuard guard(cfg, {});
    const auto validation = guard.validate_patch(diffgate::parse_patch(one_file_diff("lib/b.txt")));
    if (!validation.ok || validation.rejected_targets != std::vector<std::string>{"lib/b.txt"}) {
      std::cerr << "non-strict validation wrong\n";
      ++failures;
    }
  }

  // Test: a diff touching secrets/key.txt is refused and never applied.
  {
    const auto cfg = make_scope({"src/*.txt"});
    const diffgate::ScopeGuard guard(cfg, temp_root);
    const std::string raw = "```diff\n" + one_file_diff("secrets/key.txt") + "```\n";
    diffgate::PipelineOptions options;
    options.apply.repo_root = temp_root;
    options.apply.staging_dir = temp_root / "staging_reject";
    options.apply.git = "/nonexistent/git";
    const auto result = diffgate::run_change_pipeline(raw, guard, options);
    if (result.status != diffgate::PipelineStatus::Rejected || result.validation.ok ||
        result.validation.rejected_targets != std::vector<std::string>{"secrets/key.txt"}) {
      std::cerr << "secrets/key.txt not rejected\n";
      ++failures;
    }
    if (!result.apply.attempts.empty() || fs::exists(options.apply.staging_dir)) {
      std::cerr << "apply ran for a rejected patch\n";
      ++failures;
    }
    const json out = diffgate::pipeline_result_to_json(result);
    if (out.value("ok", true) || out.value("status", "") != "rejected" ||
        out["rejectedTargets"] != json::array({"secrets/key.txt"}) || !out["changedPaths"].empty()) {
      std::cerr << "rejected result json wrong: " << out.dump() << "\n";
      ++failures;
    }
  }

  // Test: directory modify candidates need dir_rewrite_allowed.
  {
    fs::create_directories(temp_root / "tree" / "src" / "sub");
    auto cfg = make_scope({"src*"});
    const diffgate::ScopeGuard guard(cfg, temp_root / "tree");
    auto filtered = guard.filter_paths({}, {"src/", "src/sub", "src/file.txt"});
    if (filtered.allowed_modify != std::vector<std::string>{"src/file.txt"} || filtered.rejected.size() != 2) {
      std::cerr << "directory candidates should be rejected\n";
      ++failures;
    }
    cfg.dir_rewrite_allowed = true;
    filtered = guard.filter_paths({}, {"src/", "src/sub"});
    if (filtered.allowed_modify.size() != 2 || !filtered.rejected.empty()) {
      std::cerr << "directory candidates should be accepted with dir_rewrite_allowed\n";
      ++failures;
    }
  }

  // Test: create candidates only match create globs.
  {
    const auto cfg = make_scope({"src/*"}, {"src/new_*"});
    const diffgate::ScopeGuard guard(cfg, {});
    const auto filtered = guard.filter_paths({"src/new_a.cpp", "src/old.cpp"}, {});
    if (filtered.allowed_create != std::vector<std::string>{"src/new_a.cpp"} || filtered.rejected.size() != 1 ||
        filtered.rejected[0].path != "src/old.cpp") {
      std::cerr << "create filtering wrong\n";
      ++failures;
    }
  }

  // Test: unsafe paths are never authorized; '*' crosses '/'; tests globs authorize nothing.
  {
    auto cfg = make_scope({"*"});
    cfg.tests = {"tests/*"};
    const diffgate::ScopeGuard guard(cfg, {});
    if (guard.is_authorized("../etc/passwd") || guard.is_authorized("/etc/passwd") ||
        guard.is_authorized("a/../../b") || guard.is_authorized("")) {
      std::cerr << "unsafe path authorized\n";
      ++failures;
    }
    if (!diffgate::glob_match("src/*.txt", "src/a/b.txt") || !diffgate::glob_match("src/*.txt", ".\\src\\x.txt") ||
        diffgate::glob_match("src/?.txt", "src/ab.txt")) {
      std::cerr << "glob semantics wrong\n";
      ++failures;
    }
    const auto tests_only = make_scope({});
    diffgate::ScopeConfig with_tests = tests_only;
    with_tests.tests = {"tests/*"};
    const diffgate::ScopeGuard tests_guard(with_tests, {});
    if (tests_guard.is_authorized("tests/a.cpp")) {
      std::cerr << "tests glob authorized a path\n";
      ++failures;
    }
    const auto validation = guard.validate_patch(diffgate::parse_patch(one_file_diff("tests/a_test.cpp")));
    if (validation.test_targets != std::vector<std::string>{"tests/a_test.cpp"}) {
      std::cerr << "test targets not reported\n";
      ++failures;
    }
  }

  // Test: targets of new files, deletions and renames.
  {
    const std::string text =
        "diff --git a/new.txt b/new.txt\nnew file mode 100644\n--- /dev/null\n+++ b/new.txt\n@@ -0,0 +1 @@\n+x\n"
        "diff --git a/gone.txt b/gone.txt\ndeleted file mode 100644\n--- a/gone.txt\n+++ /dev/null\n@@ -1 +0,0 @@\n-y\n"
        "diff --git a/old/name.txt b/new/name.txt\nsimilarity index 100%\nrename from old/name.txt\n"
        "rename to new/name.txt\n";
    const auto patch = diffgate::parse_patch(text);
    if (patch.files.size() != 3) {
      std::cerr << "expected three file sections, got " << patch.files.size() << "\n";
      ++failures;
    } else {
      if (!patch.files[0].is_new || patch.files[0].target_path() != "new.txt") {
        std::cerr << "new file target wrong\n";
        ++failures;
      }
      if (!patch.files[1].is_deleted || patch.files[1].target_path() != "gone.txt") {
        std::cerr << "deletion target wrong\n";
        ++failures;
      }
      const auto renamed = diffgate::declared_paths(patch.files[2]);
      if (!patch.files[2].is_rename || as_set(renamed) != std::set<std::string>{"new/name.txt", "old/name.txt"}) {
        std::cerr << "rename paths wrong\n";
        ++failures;
      }
    }
    if (!diffgate::patch_uses_ab_prefix(text) || diffgate::patch_uses_ab_prefix("diff --git x y\n")) {
      std::cerr << "a/ b/ prefix detection wrong\n";
      ++failures;
    }
    if (diffgate::split_sections(text).size() != 3) {
      std::cerr << "section split wrong\n";
      ++failures;
    }
    if (diffgate::strip_path("a/src/x.c", 1) != "src/x.c" || !diffgate::strip_path("x.c", 1).empty()) {
      std::cerr << "strip_path wrong\n";
      ++failures;
    }
  }

  // Test: zero-context transform splits at interior context and recomputes counts.
  {
    const std::string text =
        "diff --git a/f.txt b/f.txt\n--- a/f.txt\n+++ b/f.txt\n"
        "@@ -10,9 +10,9 @@\n a\n-b\n+B\n c\n d\n-e\n+E\n+E2\n f\n";
    const auto patch = diffgate::parse_patch(text);
    if (patch.files.size() != 1 || patch.files[0].hunks.size() != 1) {
      std::cerr << "zero-context input not parsed\n";
      ++failures;
    } else {
      const auto zc = diffgate::make_zero_context(patch.files[0]);
      if (zc.hunks.size() != 2) {
        std::cerr << "zero-context should split into two hunks\n";
        ++failures;
      } else {
        const auto& h1 = zc.hunks[0];
        const auto& h2 = zc.hunks[1];
        if (h1.old_start != 11 || h1.old_len != 1 || h1.new_start != 11 || h1.new_len != 1) {
          std::cerr << "first zero-context hunk header wrong\n";
          ++failures;
        }
        if (h2.old_start != 14 || h2.old_len != 1 || h2.new_start != 14 || h2.new_len != 2) {
          std::cerr << "second zero-context hunk header wrong\n";
          ++failures;
        }
        for (const auto& hunk : zc.hunks) {
          for (const auto& line : hunk.lines) {
            if (line.kind == diffgate::HunkLineKind::Context) {
              std::cerr << "zero-context hunk kept context\n";
              ++failures;
            }
          }
        }
      }
      if (zc.section_text.find("@@ -11,1 +11,1 @@") == std::string::npos ||
          zc.section_text.find("@@ -14,1 +14,2 @@") == std::string::npos) {
        std::cerr << "zero-context rendering wrong:\n" << zc.section_text;
        ++failures;
      }
    }
  }

  // Test: a pure insertion keeps the insert-after convention.
  {
    const std::string text = "diff --git a/f b/f\n--- a/f\n+++ b/f\n@@ -3,2 +3,3 @@\n x\n+y\n z\n";
    const auto zc = diffgate::make_zero_context(diffgate::parse_patch(text).files.at(0));
    if (zc.hunks.size() != 1 || zc.hunks[0].old_start != 3 || zc.hunks[0].old_len != 0 ||
        zc.hunks[0].new_start != 4 || zc.hunks[0].new_len != 1) {
      std::cerr << "zero-context insertion header wrong\n";
      ++failures;
    }
  }

  // Test: the git apply matrix order and strip depth order.
  {
    const auto matrix = diffgate::git_apply_matrix(diffgate::ApplyTier::WholePatch, "p.diff", true);
    if (matrix.size() != 16) {
      std::cerr << "matrix size " << matrix.size() << "\n";
      ++failures;
    } else {
      if (matrix[0].id != "git apply -3 -p1 --whitespace=fix" || !matrix[0].three_way) {
        std::cerr << "first combination wrong: " << matrix[0].id << "\n";
        ++failures;
      }
      if (matrix[1].id != "git apply -p1 --whitespace=fix" || matrix[1].three_way) {
        std::cerr << "second combination wrong: " << matrix[1].id << "\n";
        ++failures;
      }
      if (matrix[7].id != "git apply -p1 --whitespace=fix --reject --unidiff-zero") {
        std::cerr << "last depth-1 combination wrong: " << matrix[7].id << "\n";
        ++failures;
      }
      if (matrix[8].id != "git apply -3 -p0 --whitespace=fix" || matrix[0].args.back() != "p.diff") {
        std::cerr << "depth order wrong: " << matrix[8].id << "\n";
        ++failures;
      }
    }
    if (diffgate::strip_depth_order(false) != std::vector<int>{0, 1}) {
      std::cerr << "plain diffs should try -p0 first\n";
      ++failures;
    }
    const auto zc = diffgate::zero_context_strategies("z.diff", true);
    if (zc.size() != 2 || zc[0].id != "git apply -p1 --whitespace=fix --unidiff-zero --ignore-whitespace") {
      std::cerr << "zero-context strategies wrong\n";
      ++failures;
    }
    const auto fuzzy = diffgate::fuzzy_patch_strategies("s.diff", "s.rej", true);
    if (fuzzy.size() != 2 || !fuzzy[0].allows_partial ||
        fuzzy[0].id != "patch -p1 -f -N --follow-symlinks --no-backup-if-mismatch" ||
        std::find(fuzzy[0].args.begin(), fuzzy[0].args.end(), "s.rej") == fuzzy[0].args.end()) {
      std::cerr << "fuzzy strategies wrong\n";
      ++failures;
    }
    int calls = 0;
    const auto* winner = diffgate::first_success(matrix, [&](const diffgate::ApplyStrategy& s) {
      ++calls;
      return s.id == matrix[3].id;
    });
    if (winner != &matrix[3] || calls != 4) {
      std::cerr << "first_success did not stop at the first success\n";
      ++failures;
    }
  }

  // Test: tree snapshot detects and restores changes.
  {
    const fs::path tree = temp_root / "snap";
    write_text(tree / "keep.txt", "one\n");
    write_text(tree / "edit.txt", "two\n");
    const auto snap = diffgate::TreeSnapshot::capture(tree, {"edit.txt", "made/new.txt"}, {});
    write_text(tree / "edit.txt", "changed\n");
    write_text(tree / "made" / "new.txt", "x\n");
    const auto changes = snap.diff_against_current();
    if (changes.modified != std::vector<std::string>{"edit.txt"} ||
        changes.added != std::vector<std::string>{"made/new.txt"}) {
      std::cerr << "snapshot diff wrong\n";
      ++failures;
    }
    std::string error;
    if (!snap.restore(changes, error) || fs::exists(tree / "made") || !snap.diff_against_current().empty()) {
      std::cerr << "snapshot restore wrong: " << error << "\n";
      ++failures;
    }
    fs::permissions(tree / "edit.txt", fs::perms::owner_exec, fs::perm_options::add);
    const auto mode_changes = snap.diff_against_current();
    if (mode_changes.modified != std::vector<std::string>{"edit.txt"}) {
      std::cerr << "snapshot missed a permissions change\n";
      ++failures;
    }
    if (!snap.restore(mode_changes, error) ||
        (fs::status(tree / "edit.txt").permissions() & fs::perms::owner_exec) != fs::perms::none) {
      std::cerr << "snapshot did not restore permissions: " << error << "\n";
      ++failures;
    }
    if (diffgate::to_hex(diffgate::fnv1a_64("")) != "cbf29ce484222325") {
      std::cerr << "fnv1a offset basis wrong\n";
      ++failures;
    }
  }

  // Test: path remapping picks the best tracked file.
  {
    const std::vector<std::string> files = {"src/app/main.cpp", "tools/main.cpp", "src/app/util.cpp", "README.md"};
    const auto match = diffgate::best_match_path("app/main.cpp", files);
    if (!match.has_value() || *match != "src/app/main.cpp") {
      std::cerr << "basename remap wrong\n";
      ++failures;
    }
    const auto fuzzy = diffgate::best_match_path("src/app/utils.cpp", files);
    if (!fuzzy.has_value() || *fuzzy != "src/app/util.cpp") {
      std::cerr << "similarity remap wrong\n";
      ++failures;
    }
    if (diffgate::best_match_path("zzz/qqq.bin", files).has_value()) {
      std::cerr << "remap matched an unrelated file\n";
      ++failures;
    }
    if (diffgate::similarity_ratio("abc", "abc") != 1.0 || diffgate::similarity_ratio("abc", "xyz") != 0.0) {
      std::cerr << "similarity ratio wrong\n";
      ++failures;
    }

    const fs::path tree = temp_root / "remap";
    write_text(tree / "src" / "app" / "main.cpp", "old\n");
    const auto repo_files = diffgate::list_repo_files(tree);
    const auto patch = diffgate::parse_patch(one_file_diff("app/main.cpp") +
                                             "diff --git a/brand_new.txt b/brand_new.txt\nnew file mode 100644\n"
                                             "--- /dev/null\n+++ b/brand_new.txt\n@@ -0,0 +1 @@\n+x\n");
    const auto remapped = diffgate::remap_missing_paths(patch, tree, repo_files);
    if (remapped.remapped.size() != 1 || remapped.remapped[0].to != "src/app/main.cpp" ||
        remapped.patch.files.size() != 2 || remapped.patch.files[0].target_path() != "src/app/main.cpp" ||
        remapped.patch.files[1].target_path() != "brand_new.txt") {
      std::cerr << "remap_missing_paths wrong\n";
      ++failures;
    }
  }

  // Test: tool config overrides only the keys present.
  {
    const fs::path path = temp_root / "diffgate.json";
    write_text(path, R"({"diffgate":{"patch":"gpatch","fuzzy_fallback":false,"diagnostic_limit":200}})");
    const auto cfg = diffgate::load_tool_config(path);
    if (cfg.patch != "gpatch" || cfg.fuzzy_fallback || cfg.diagnostic_limit != 200 || cfg.git != "git" ||
        cfg.remap_missing_paths) {
      std::cerr << "tool config not applied\n";
      ++failures;
    }
    const auto defaults = diffgate::load_tool_config(temp_root / "absent.json");
    if (defaults.git != "git" || !defaults.fuzzy_fallback || defaults.diagnostic_limit != 1600) {
      std::cerr << "tool config defaults wrong\n";
      ++failures;
    }
    if (diffgate::default_config_path(temp_root) != path) {
      std::cerr << "default config lookup wrong\n";
      ++failures;
    }
    const fs::path levels = temp_root / "levels.json";
    write_text(levels, R"({"log_level":"WARN"})");
    write_text(temp_root / "bad_level.json", R"({"log_level":"loud"})");
    if (diffgate::load_tool_config(levels).log_level != "WARN" ||
        diffgate::load_tool_config(temp_root / "bad_level.json").log_level != "info") {
      std::cerr << "log_level config wrong\n";
      ++failures;
    }
  }

  // Test: log threshold drops quieter lines and the run id tags the rest.
  {
    diffgate::log::Level parsed = diffgate::log::Level::Info;
    if (!diffgate::log::parse_level("Warning", parsed) || parsed != diffgate::log::Level::Warn ||
        diffgate::log::parse_level("verbose", parsed)) {
      std::cerr << "log level parsing wrong\n";
      ++failures;
    }
    const auto previous = diffgate::log::level();
    diffgate::log::set_level(diffgate::log::Level::Warn);
    diffgate::log::set_run_id("run_42");
    diffgate::log::info("quiet line");
    diffgate::log::warn("loud line");
    diffgate::log::set_run_id("");
    diffgate::log::set_level(previous);
    const auto lines = diffgate::log::recent(1);
    if (lines.size() != 1 || lines[0].find("[WARN][run_42] loud line") == std::string::npos) {
      std::cerr << "log threshold or run tag wrong\n";
      ++failures;
    }
  }

  // Test: no diff in the input yields no_patch.
  {
    const auto cfg = make_scope({"*"});
    const diffgate::ScopeGuard guard(cfg, temp_root);
    diffgate::PipelineOptions options;
    options.apply.repo_root = temp_root;
    options.apply.staging_dir = temp_root / "staging_none";
    const auto result = diffgate::run_change_pipeline("I could not find the bug.", guard, options);
    const json out = diffgate::pipeline_result_to_json(result, "run1");
    if (result.status != diffgate::PipelineStatus::NoPatch || out.value("status", "") != "no_patch" ||
        out.value("run_id", "") != "run1") {
      std::cerr << "no_patch status wrong\n";
      ++failures;
    }
  }

  diffgate::log::shutdown();
  std::error_code ec;
  fs::remove_all(temp_root, ec);
  return failures == 0 ? 0 : 1;
}
