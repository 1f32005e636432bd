#pragma once

#include <filesystem>
#include <string>

namespace diffgate {

struct ToolConfig {
  std::string git = "git";
  std::string patch = "patch";
  // Empty: derived from the repository root.
  std::string staging_root;
  size_t diagnostic_limit = 1600;
  bool fuzzy_fallback = true;
  bool remap_missing_paths = false;
  // debug, info, warn or error.
  std::string log_level = "info";
};

// Missing file or unknown extension: defaults with a warning. Keys absent from the
// file keep their defaults; keys may be nested under "diffgate".
ToolConfig load_tool_config(const std::filesystem::path& path);

// diffgate.json, diffgate.yaml or diffgate.yml under root, whichever exists first.
std::filesystem::path default_config_path(const std::filesystem::path& root);

} // namespace diffgate
