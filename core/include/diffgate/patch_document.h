#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace diffgate {

enum class HunkLineKind {
  Context,
  Add,
  Remove
};

struct HunkLine {
  HunkLineKind kind = HunkLineKind::Context;
  std::string text;
  bool no_newline_at_end = false;
};

struct Hunk {
  // Counts as declared in the "@@" header; the body is authoritative.
  int old_start = 0;
  int old_len = 1;
  int new_start = 0;
  int new_len = 1;
  std::string section_suffix;
  std::vector<HunkLine> lines;

  int body_old_len() const;
  int body_new_len() const;
};

struct FileChange {
  // Paths with the a/ and b/ prefixes removed when the diff uses that convention.
  std::string old_path;
  std::string new_path;
  bool has_ab_prefix = false;
  bool is_new = false;
  bool is_deleted = false;
  bool is_binary = false;
  bool is_rename = false;
  // Header lines up to the first hunk, verbatim and without trailing newlines.
  std::vector<std::string> header_lines;
  std::vector<Hunk> hunks;
  // Exact text of this file's section in the source diff.
  std::string section_text;

  // Path the change writes: the new path, or the old path for a deletion.
  const std::string& target_path() const;
};

struct PatchDocument {
  std::string text;
  std::vector<FileChange> files;

  bool empty() const { return files.empty(); }
};

PatchDocument parse_patch(std::string_view text);
std::string render_file_change(const FileChange& change);

// True when any section header uses the canonical "diff --git a/X b/Y" form.
bool patch_uses_ab_prefix(std::string_view text);

// Per-file sections starting at each "diff --git" header, each ending in a newline.
std::vector<std::string> split_sections(std::string_view text);

// Rewrites hunks without context lines; interior context splits a hunk and
// line counts are recomputed from the body.
FileChange make_zero_context(const FileChange& change);

// Path as seen by a tool run with -p<depth>; empty when the path has too few segments.
std::string strip_path(std::string_view path, int depth);

// Normalized paths the change is allowed to write: its target, plus the old path of a rename.
std::vector<std::string> declared_paths(const FileChange& change);

// Every tree path a tool could touch for this change at strip depth 0 or 1.
std::vector<std::string> candidate_tree_paths(const FileChange& change);

} // namespace diffgate
