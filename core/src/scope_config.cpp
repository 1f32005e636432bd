#include "diffgate/scope_config.h"

#include "diffgate/log.h"
#include "diffgate_data/serialization.h"

#include <sstream>
#include <unordered_set>

namespace diffgate {

namespace {
using json = nlohmann::json;

void add_error(ScopeConfigLoadResult& result, const std::string& keypath, const std::string& message) {
  result.errors.push_back({keypath, message});
}

void read_glob_list(const json& node,
                    const std::string& key,
                    const std::string& base,
                    std::vector<std::string>& out,
                    ScopeConfigLoadResult& result) {
  if (!node.contains(key) || node[key].is_null()) {
    return;
  }
  const auto& list = node[key];
  const std::string keypath = base + "." + key;
  if (!list.is_array()) {
    add_error(result, keypath, "expected array of glob strings");
    return;
  }
  for (size_t i = 0; i < list.size(); ++i) {
    const auto& item = list[i];
    if (!item.is_string() || item.get<std::string>().empty()) {
      add_error(result, keypath + "[" + std::to_string(i) + "]", "expected non-empty string");
      continue;
    }
    out.push_back(item.get<std::string>());
  }
}

void read_bool(const json& node,
               const std::string& key,
               const std::string& base,
               bool& out,
               ScopeConfigLoadResult& result) {
  if (!node.contains(key) || node[key].is_null()) {
    return;
  }
  if (!node[key].is_boolean()) {
    add_error(result, base + "." + key, "expected boolean; keeping default");
    return;
  }
  out = node[key].get<bool>();
}

void warn_unknown_keys(const json& node,
                       const std::string& base,
                       const std::unordered_set<std::string>& known,
                       ScopeConfigLoadResult& result) {
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (known.count(it.key()) == 0) {
      result.warnings.push_back(base + "." + it.key() + ": unknown key ignored");
    }
  }
}

void parse_scope_shape(const json& scope, ScopeConfigLoadResult& result) {
  if (!scope.is_object()) {
    add_error(result, "scope", "expected object");
    return;
  }
  read_glob_list(scope, "create", "scope", result.config.create, result);
  read_glob_list(scope, "modify", "scope", result.config.modify, result);
  read_glob_list(scope, "tests", "scope", result.config.tests, result);
  read_bool(scope, "strict_mode", "scope", result.config.strict_mode, result);
  read_bool(scope, "dir_rewrite_allowed", "scope", result.config.dir_rewrite_allowed, result);
  warn_unknown_keys(scope, "scope",
                    {"create", "modify", "tests", "strict_mode", "dir_rewrite_allowed"}, result);
}

void parse_legacy_shape(const json& root, ScopeConfigLoadResult& result) {
  if (root.contains("allowed_targets")) {
    const auto& targets = root["allowed_targets"];
    if (targets.is_array()) {
      // Oldest descriptors listed modifiable paths directly.
      json wrapped = json::object();
      wrapped["modify"] = targets;
      read_glob_list(wrapped, "modify", "allowed_targets", result.config.modify, result);
    } else if (targets.is_object()) {
      read_glob_list(targets, "create", "allowed_targets", result.config.create, result);
      read_glob_list(targets, "modify", "allowed_targets", result.config.modify, result);
      read_glob_list(targets, "tests", "allowed_targets", result.config.tests, result);
      warn_unknown_keys(targets, "allowed_targets", {"create", "modify", "tests"}, result);
    } else if (!targets.is_null()) {
      add_error(result, "allowed_targets", "expected object or array");
    }
  }
  if (root.contains("execution")) {
    const auto& execution = root["execution"];
    if (execution.is_object()) {
      read_bool(execution, "strict_mode", "execution", result.config.strict_mode, result);
      read_bool(execution, "dir_rewrite_allowed", "execution", result.config.dir_rewrite_allowed, result);
    } else if (!execution.is_null()) {
      add_error(result, "execution", "expected object");
    }
  }
}
} // namespace

ScopeConfigLoadResult parse_scope_config(const json& descriptor) {
  ScopeConfigLoadResult result;
  if (!descriptor.is_object()) {
    add_error(result, "", "descriptor must be an object");
    return result;
  }
  const json& root =
      (descriptor.contains("task") && descriptor["task"].is_object()) ? descriptor["task"] : descriptor;

  const bool has_scope = root.contains("scope");
  const bool has_legacy = root.contains("allowed_targets") || root.contains("execution");
  if (has_scope) {
    result.shape = ScopeDescriptorShape::Scope;
    parse_scope_shape(root["scope"], result);
    if (has_legacy) {
      result.warnings.push_back("allowed_targets/execution ignored: scope takes precedence");
    }
  } else if (has_legacy) {
    result.shape = ScopeDescriptorShape::Legacy;
    parse_legacy_shape(root, result);
  } else {
    add_error(result, "scope", "missing; no path is authorized");
  }
  return result;
}

ScopeConfigLoadResult load_scope_config(const std::filesystem::path& path) {
  json descriptor;
  std::string error;
  if (!diffgate::data::load_structured_file(path, descriptor, error)) {
    ScopeConfigLoadResult result;
    add_error(result, "", error);
    log::warn("scope descriptor unusable, denying all: " + error);
    return result;
  }
  auto result = parse_scope_config(descriptor);
  for (const auto& warning : result.warnings) {
    log::warn("scope descriptor: " + warning);
  }
  if (!result.ok()) {
    log::warn("scope descriptor " + path.string() + ": " + std::to_string(result.errors.size()) +
              " error(s), affected fields keep safe defaults");
  }
  return result;
}

json scope_config_to_json(const ScopeConfig& config) {
  json out;
  out["create"] = config.create;
  out["modify"] = config.modify;
  out["tests"] = config.tests;
  out["strict_mode"] = config.strict_mode;
  out["dir_rewrite_allowed"] = config.dir_rewrite_allowed;
  return out;
}

std::string format_scope_errors(const std::vector<ScopeConfigError>& errors, size_t limit) {
  std::ostringstream out;
  const size_t count = errors.size();
  for (size_t i = 0; i < count && i < limit; ++i) {
    out << (errors[i].keypath.empty() ? "<root>" : errors[i].keypath) << " -> " << errors[i].message
        << "\n";
  }
  if (count > limit) {
    out << "... and " << (count - limit) << " more error(s)\n";
  }
  return out.str();
}

} // namespace diffgate
