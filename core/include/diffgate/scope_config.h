#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace diffgate {

// Allow-lists for one pipeline invocation. Defaults deny everything.
struct ScopeConfig {
  std::vector<std::string> create;
  std::vector<std::string> modify;
  std::vector<std::string> tests;
  bool strict_mode = true;
  bool dir_rewrite_allowed = false;
};

struct ScopeConfigError {
  std::string keypath;
  std::string message;
};

enum class ScopeDescriptorShape {
  None,
  Scope,
  Legacy
};

struct ScopeConfigLoadResult {
  ScopeConfig config;
  ScopeDescriptorShape shape = ScopeDescriptorShape::None;
  std::vector<ScopeConfigError> errors;
  std::vector<std::string> warnings;

  bool ok() const { return errors.empty(); }
};

// Reads "scope" (preferred) or "allowed_targets"/"execution" (legacy), optionally nested
// under "task". Fields that are missing or malformed keep their safe defaults.
ScopeConfigLoadResult parse_scope_config(const nlohmann::json& descriptor);

// JSON or YAML by extension. A missing or unreadable file yields defaults plus an error.
ScopeConfigLoadResult load_scope_config(const std::filesystem::path& path);

nlohmann::json scope_config_to_json(const ScopeConfig& config);
std::string format_scope_errors(const std::vector<ScopeConfigError>& errors, size_t limit = 10);

} // namespace diffgate
