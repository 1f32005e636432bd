#include "diffgate/patch_document.h"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace diffgate {

namespace {
constexpr std::string_view kHeaderPrefix = "diff --git ";
constexpr std::string_view kDevNull = "/dev/null";
constexpr std::string_view kNoNewline = "\\ No newline at end of file";

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string_view> split_lines_view(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (pos < text.size()) {
    const size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      lines.push_back(text.substr(pos));
      break;
    }
    lines.push_back(text.substr(pos, end - pos));
    pos = end + 1;
  }
  return lines;
}

// "--- a/path\t2024-01-01 ..." -> "a/path"
std::string marker_path(std::string_view line) {
  std::string_view rest = line.substr(4);
  const size_t tab = rest.find('\t');
  if (tab != std::string_view::npos) {
    rest = rest.substr(0, tab);
  }
  while (!rest.empty() && (rest.back() == ' ' || rest.back() == '\r')) {
    rest.remove_suffix(1);
  }
  if (rest.size() >= 2 && rest.front() == '"' && rest.back() == '"') {
    rest = rest.substr(1, rest.size() - 2);
  }
  return std::string(rest);
}

std::string drop_prefix(const std::string& path, std::string_view prefix) {
  if (starts_with(path, prefix)) {
    return path.substr(prefix.size());
  }
  return path;
}

bool parse_int(std::string_view text, int& out) {
  if (text.empty()) return false;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), out);
  return result.ec == std::errc() && result.ptr == text.data() + text.size();
}

// "-12,3" or "+4" -> start/len
bool parse_range(std::string_view token, int& start, int& len) {
  if (token.empty()) return false;
  token.remove_prefix(1);
  const size_t comma = token.find(',');
  if (comma == std::string_view::npos) {
    len = 1;
    return parse_int(token, start);
  }
  return parse_int(token.substr(0, comma), start) && parse_int(token.substr(comma + 1), len);
}

bool parse_hunk_header(std::string_view line, Hunk& hunk) {
  // @@ -a[,b] +c[,d] @@[ suffix]
  if (!starts_with(line, "@@ ")) return false;
  std::string_view rest = line.substr(3);
  const size_t close = rest.find(" @@");
  if (close == std::string_view::npos) return false;
  const std::string_view ranges = rest.substr(0, close);
  const size_t space = ranges.find(' ');
  if (space == std::string_view::npos) return false;
  const std::string_view old_range = ranges.substr(0, space);
  const std::string_view new_range = ranges.substr(space + 1);
  if (old_range.empty() || old_range.front() != '-') return false;
  if (new_range.empty() || new_range.front() != '+') return false;
  if (!parse_range(old_range, hunk.old_start, hunk.old_len)) return false;
  if (!parse_range(new_range, hunk.new_start, hunk.new_len)) return false;
  hunk.section_suffix = std::string(rest.substr(close + 3));
  return true;
}

void parse_git_header(std::string_view line, FileChange& change) {
  std::string_view rest = line.substr(kHeaderPrefix.size());
  while (!rest.empty() && rest.back() == ' ') {
    rest.remove_suffix(1);
  }
  if (starts_with(rest, "a/")) {
    const size_t split = rest.rfind(" b/");
    if (split != std::string_view::npos) {
      change.has_ab_prefix = true;
      change.old_path = std::string(rest.substr(2, split - 2));
      change.new_path = std::string(rest.substr(split + 3));
      return;
    }
  }
  // No prefix convention: split the two paths in the middle when they are identical.
  const size_t mid = rest.size() / 2;
  if (rest.size() % 2 == 1 && rest[mid] == ' ' && rest.substr(0, mid) == rest.substr(mid + 1)) {
    change.old_path = std::string(rest.substr(0, mid));
    change.new_path = change.old_path;
    return;
  }
  const size_t space = rest.find(' ');
  if (space == std::string_view::npos) {
    change.old_path = std::string(rest);
    change.new_path = change.old_path;
    return;
  }
  change.old_path = std::string(rest.substr(0, space));
  change.new_path = std::string(rest.substr(space + 1));
}

FileChange parse_section(std::string_view section) {
  FileChange change;
  change.section_text = std::string(section);
  const auto lines = split_lines_view(section);
  Hunk* current = nullptr;
  bool in_hunks = false;
  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string_view line = lines[i];
    if (i == 0 && starts_with(line, kHeaderPrefix)) {
      parse_git_header(line, change);
      change.header_lines.emplace_back(line);
      continue;
    }
    if (starts_with(line, "@@ ")) {
      Hunk hunk;
      if (parse_hunk_header(line, hunk)) {
        change.hunks.push_back(std::move(hunk));
        current = &change.hunks.back();
        in_hunks = true;
        continue;
      }
    }
    if (!in_hunks) {
      change.header_lines.emplace_back(line);
      if (starts_with(line, "--- ")) {
        const auto path = marker_path(line);
        if (path == kDevNull) {
          change.is_new = true;
        } else {
          change.old_path = drop_prefix(path, "a/");
        }
      } else if (starts_with(line, "+++ ")) {
        const auto path = marker_path(line);
        if (path == kDevNull) {
          change.is_deleted = true;
        } else {
          change.new_path = drop_prefix(path, "b/");
        }
      } else if (starts_with(line, "new file mode ")) {
        change.is_new = true;
      } else if (starts_with(line, "deleted file mode ")) {
        change.is_deleted = true;
      } else if (starts_with(line, "rename from ")) {
        change.is_rename = true;
        change.old_path = std::string(line.substr(12));
      } else if (starts_with(line, "rename to ")) {
        change.is_rename = true;
        change.new_path = std::string(line.substr(10));
      } else if (starts_with(line, "Binary files ") || starts_with(line, "GIT binary patch")) {
        change.is_binary = true;
      }
      continue;
    }
    if (starts_with(line, kNoNewline)) {
      if (current && !current->lines.empty()) {
        current->lines.back().no_newline_at_end = true;
      }
      continue;
    }
    if (!current) continue;
    HunkLine hunk_line;
    if (line.empty()) {
      hunk_line.kind = HunkLineKind::Context;
    } else if (line.front() == '+') {
      hunk_line.kind = HunkLineKind::Add;
      hunk_line.text = std::string(line.substr(1));
    } else if (line.front() == '-') {
      hunk_line.kind = HunkLineKind::Remove;
      hunk_line.text = std::string(line.substr(1));
    } else {
      hunk_line.kind = HunkLineKind::Context;
      hunk_line.text = std::string(line.substr(1));
    }
    current->lines.push_back(std::move(hunk_line));
  }
  if (change.is_deleted && change.new_path.empty()) {
    change.new_path = change.old_path;
  }
  if (change.is_new && change.old_path.empty()) {
    change.old_path = change.new_path;
  }
  return change;
}

void render_hunk(std::ostringstream& out, const Hunk& hunk) {
  out << "@@ -" << hunk.old_start << "," << hunk.old_len << " +" << hunk.new_start << ","
      << hunk.new_len << " @@" << hunk.section_suffix << "\n";
  for (const auto& line : hunk.lines) {
    switch (line.kind) {
      case HunkLineKind::Context:
        out << ' ';
        break;
      case HunkLineKind::Add:
        out << '+';
        break;
      case HunkLineKind::Remove:
        out << '-';
        break;
    }
    out << line.text << "\n";
    if (line.no_newline_at_end) {
      out << kNoNewline << "\n";
    }
  }
}
} // namespace

int Hunk::body_old_len() const {
  int count = 0;
  for (const auto& line : lines) {
    if (line.kind != HunkLineKind::Add) ++count;
  }
  return count;
}

int Hunk::body_new_len() const {
  int count = 0;
  for (const auto& line : lines) {
    if (line.kind != HunkLineKind::Remove) ++count;
  }
  return count;
}

const std::string& FileChange::target_path() const {
  return is_deleted ? old_path : new_path;
}

PatchDocument parse_patch(std::string_view text) {
  PatchDocument doc;
  doc.text = std::string(text);
  for (const auto& section : split_sections(text)) {
    doc.files.push_back(parse_section(section));
  }
  return doc;
}

std::string render_file_change(const FileChange& change) {
  std::ostringstream out;
  for (const auto& line : change.header_lines) {
    out << line << "\n";
  }
  for (const auto& hunk : change.hunks) {
    render_hunk(out, hunk);
  }
  return out.str();
}

bool patch_uses_ab_prefix(std::string_view text) {
  for (const auto line : split_lines_view(text)) {
    if (!starts_with(line, kHeaderPrefix)) continue;
    const std::string_view rest = line.substr(kHeaderPrefix.size());
    if (starts_with(rest, "a/") && rest.find(" b/") != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> split_sections(std::string_view text) {
  std::vector<size_t> starts;
  size_t pos = 0;
  while (pos < text.size()) {
    if (starts_with(text.substr(pos), kHeaderPrefix)) {
      starts.push_back(pos);
    }
    const size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }
  std::vector<std::string> sections;
  sections.reserve(starts.size());
  for (size_t i = 0; i < starts.size(); ++i) {
    const size_t end = (i + 1 < starts.size()) ? starts[i + 1] : text.size();
    std::string section(text.substr(starts[i], end - starts[i]));
    if (section.empty() || section.back() != '\n') {
      section.push_back('\n');
    }
    sections.push_back(std::move(section));
  }
  return sections;
}

FileChange make_zero_context(const FileChange& change) {
  FileChange out = change;
  out.hunks.clear();
  for (const auto& hunk : change.hunks) {
    // Zero-length ranges name the line before the hunk; step onto the first line.
    int old_line = hunk.old_len == 0 ? hunk.old_start + 1 : hunk.old_start;
    int new_line = hunk.new_len == 0 ? hunk.new_start + 1 : hunk.new_start;
    Hunk group;
    bool open = false;
    int group_old_first = 0;
    int group_new_first = 0;

    auto flush = [&]() {
      if (!open) return;
      group.old_len = group.body_old_len();
      group.new_len = group.body_new_len();
      group.old_start = group.old_len > 0 ? group_old_first : group_old_first - 1;
      group.new_start = group.new_len > 0 ? group_new_first : group_new_first - 1;
      out.hunks.push_back(std::move(group));
      group = Hunk{};
      open = false;
    };

    for (const auto& line : hunk.lines) {
      if (line.kind == HunkLineKind::Context) {
        flush();
        ++old_line;
        ++new_line;
        continue;
      }
      if (!open) {
        open = true;
        group_old_first = old_line;
        group_new_first = new_line;
        group.section_suffix = out.hunks.empty() ? hunk.section_suffix : std::string();
      }
      group.lines.push_back(line);
      if (line.kind == HunkLineKind::Remove) {
        ++old_line;
      } else {
        ++new_line;
      }
    }
    flush();
  }
  out.section_text = render_file_change(out);
  return out;
}

std::string strip_path(std::string_view path, int depth) {
  std::string_view rest = path;
  for (int i = 0; i < depth; ++i) {
    const size_t slash = rest.find('/');
    if (slash == std::string_view::npos) {
      return {};
    }
    rest = rest.substr(slash + 1);
  }
  return std::string(rest);
}

std::vector<std::string> declared_paths(const FileChange& change) {
  std::vector<std::string> out;
  if (!change.target_path().empty()) {
    out.push_back(change.target_path());
  }
  if (change.is_rename && !change.old_path.empty() && change.old_path != change.new_path) {
    out.push_back(change.old_path);
  }
  return out;
}

std::vector<std::string> candidate_tree_paths(const FileChange& change) {
  std::vector<std::string> out;
  auto add = [&out](const std::string& path) {
    if (path.empty()) return;
    if (std::find(out.begin(), out.end(), path) == out.end()) {
      out.push_back(path);
    }
  };
  for (const auto& path : {change.new_path, change.old_path}) {
    add(path);
    add(strip_path(path, 1));
  }
  if (change.has_ab_prefix) {
    add("a/" + change.old_path);
    add("b/" + change.new_path);
  }
  return out;
}

} // namespace diffgate
