#include "diffgate/sanitizer.h"

#include <array>
#include <cctype>
#include <vector>

namespace diffgate {

namespace {
constexpr std::string_view kHeaderPrefix = "diff --git ";

constexpr std::array<std::string_view, 18> kHeaderLinePrefixes = {
    "diff --git ",
    "index ",
    "old mode ",
    "new mode ",
    "new file mode ",
    "deleted file mode ",
    "similarity index ",
    "dissimilarity index ",
    "rename from ",
    "rename to ",
    "copy from ",
    "copy to ",
    "Binary files ",
    "--- ",
    "+++ ",
    "@@ ",
    "\\ No newline at end of file",
    "GIT binary patch",
};

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

std::string normalize_line_endings(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c == '\r') {
      out.push_back('\n');
      if (i + 1 < raw.size() && raw[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::vector<std::string_view> split_lines(std::string_view text) {
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

bool is_fence(std::string_view line) {
  return starts_with(line, "```");
}

bool is_closing_fence(std::string_view line) {
  if (!is_fence(line)) return false;
  return trim(line.substr(3)).empty();
}

bool has_header(const std::vector<std::string_view>& lines, size_t begin, size_t end) {
  for (size_t i = begin; i < end; ++i) {
    if (starts_with(lines[i], kHeaderPrefix)) return true;
  }
  return false;
}

// Bodies of every fenced block that carries a diff header, in input order.
// Returns the input unchanged when no such block exists.
std::vector<std::string_view> unwrap_fences(const std::vector<std::string_view>& lines) {
  std::vector<std::string_view> out;
  bool found = false;
  size_t i = 0;
  while (i < lines.size()) {
    if (!is_fence(lines[i])) {
      ++i;
      continue;
    }
    const size_t open = i;
    size_t close = open + 1;
    while (close < lines.size() && !is_closing_fence(lines[close])) {
      ++close;
    }
    if (has_header(lines, open + 1, close)) {
      found = true;
      out.insert(out.end(), lines.begin() + static_cast<std::ptrdiff_t>(open + 1),
                 lines.begin() + static_cast<std::ptrdiff_t>(close));
    }
    i = close + 1;
  }
  return found ? out : lines;
}

// Numbered-list markers ("2.", "2.:") and dash separators models put between sections.
bool is_list_artifact(std::string_view line) {
  const std::string_view t = trim(line);
  if (t == "\xE2\x80\x93" || t == "\xE2\x80\x94") {
    return true;
  }
  size_t digits = 0;
  while (digits < t.size() && std::isdigit(static_cast<unsigned char>(t[digits]))) {
    ++digits;
  }
  if (digits == 0 || digits >= t.size() || t[digits] != '.') {
    return false;
  }
  const std::string_view tail = trim(t.substr(digits + 1));
  return tail.empty() || tail == ":";
}
} // namespace

bool is_valid_patch_line(std::string_view line) {
  if (line.empty()) return false;
  for (const auto prefix : kHeaderLinePrefixes) {
    if (starts_with(line, prefix)) return true;
  }
  const char c = line.front();
  return c == '+' || c == '-' || c == ' ';
}

std::optional<std::string> sanitize_patch(std::string_view raw) {
  const std::string text = normalize_line_endings(raw);
  const auto lines = unwrap_fences(split_lines(text));

  size_t first = lines.size();
  for (size_t i = 0; i < lines.size(); ++i) {
    if (starts_with(lines[i], kHeaderPrefix)) {
      first = i;
      break;
    }
  }
  if (first == lines.size()) {
    return std::nullopt;
  }

  std::string out;
  out.reserve(text.size());
  for (size_t i = first; i < lines.size(); ++i) {
    const auto line = lines[i];
    if (is_list_artifact(line)) continue;
    if (!is_valid_patch_line(line)) continue;
    out.append(line.data(), line.size());
    out.push_back('\n');
  }
  return out;
}

} // namespace diffgate
