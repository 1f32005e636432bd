#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace diffgate {

// Recovers a git-style diff from model output: fence unwrapping, prose removal,
// LF line endings, grammar filtering and a trailing newline.
// Returns nullopt when the text holds no "diff --git" header; callers treat that
// as "no patch produced", not as an error.
std::optional<std::string> sanitize_patch(std::string_view raw);

// True when the line may appear in a sanitized diff.
bool is_valid_patch_line(std::string_view line);

} // namespace diffgate
