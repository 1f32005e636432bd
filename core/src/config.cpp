#include "diffgate/config.h"

#include "diffgate/log.h"
#include "diffgate_data/serialization.h"

#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

namespace diffgate {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void apply_common_fields(ToolConfig& cfg, const std::string& git,
                         const std::string& patch,
                         const std::string& staging_root,
                         const std::optional<size_t>& diagnostic_limit,
                         const std::optional<bool>& fuzzy_fallback,
                         const std::optional<bool>& remap,
                         const std::string& log_level) {
  if (!git.empty()) {
    cfg.git = git;
  }
  if (!patch.empty()) {
    cfg.patch = patch;
  }
  if (!staging_root.empty()) {
    cfg.staging_root = staging_root;
  }
  if (diagnostic_limit.has_value()) {
    cfg.diagnostic_limit = *diagnostic_limit;
  }
  if (fuzzy_fallback.has_value()) {
    cfg.fuzzy_fallback = *fuzzy_fallback;
  }
  if (remap.has_value()) {
    cfg.remap_missing_paths = *remap;
  }
  if (!log_level.empty()) {
    cfg.log_level = log_level;
  }
}

std::string string_field(const nlohmann::json& node, const char* key, const std::filesystem::path& path) {
  if (!node.contains(key)) return {};
  if (!node[key].is_string()) {
    log::warn(path.string() + ": " + key + " must be a string; ignored");
    return {};
  }
  return node[key].get<std::string>();
}

std::optional<bool> bool_field(const nlohmann::json& node, const char* key, const std::filesystem::path& path) {
  if (!node.contains(key)) return std::nullopt;
  if (!node[key].is_boolean()) {
    log::warn(path.string() + ": " + key + " must be a boolean; ignored");
    return std::nullopt;
  }
  return node[key].get<bool>();
}
} // namespace

ToolConfig load_tool_config(const std::filesystem::path& path) {
  ToolConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  nlohmann::json j;
  std::string error;
  if (!diffgate::data::load_structured_file(path, j, error)) {
    log::warn(error + "; using defaults.");
    return cfg;
  }
  if (!j.is_object()) {
    log::warn(path.string() + ": expected a mapping; using defaults.");
    return cfg;
  }
  const auto& root = j.contains("diffgate") && j["diffgate"].is_object() ? j["diffgate"] : j;

  const std::string git = string_field(root, "git", path);
  const std::string patch = string_field(root, "patch", path);
  const std::string staging_root = string_field(root, "staging_root", path);
  std::optional<size_t> diagnostic_limit;
  if (root.contains("diagnostic_limit")) {
    const auto& limit = root["diagnostic_limit"];
    if (limit.is_number_integer() && limit.get<int64_t>() >= 0) {
      diagnostic_limit = static_cast<size_t>(limit.get<int64_t>());
    } else {
      log::warn(path.string() + ": diagnostic_limit must be a non-negative integer; ignored");
    }
  }
  const auto fuzzy_fallback = bool_field(root, "fuzzy_fallback", path);
  const auto remap = bool_field(root, "remap_missing_paths", path);
  std::string log_level = string_field(root, "log_level", path);
  log::Level parsed{};
  if (!log_level.empty() && !log::parse_level(log_level, parsed)) {
    log::warn(path.string() + ": unknown log_level '" + log_level + "'; ignored");
    log_level.clear();
  }

  apply_common_fields(cfg, git, patch, staging_root, diagnostic_limit, fuzzy_fallback, remap, log_level);
  return cfg;
}

std::filesystem::path default_config_path(const std::filesystem::path& root) {
  for (const char* name : {"diffgate.json", "diffgate.yaml", "diffgate.yml"}) {
    if (file_exists(root / name)) {
      return root / name;
    }
  }
  return {};
}

} // namespace diffgate
