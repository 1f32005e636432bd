#include "diffgate_data/serialization.h"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace diffgate::data {

#if DIFFGATE_ENABLE_DATA_YAML
namespace {
bool parse_int64(const std::string& value, int64_t& out) {
  const char* begin = value.data();
  const char* end = value.data() + value.size();
  if (begin == end) return false;
  auto result = std::from_chars(begin, end, out);
  return result.ec == std::errc() && result.ptr == end;
}

bool parse_double(const std::string& value, double& out) {
  if (value.empty()) return false;
  char* end = nullptr;
  out = std::strtod(value.c_str(), &end);
  return end && *end == '\0';
}
} // namespace

bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out, std::string& error) {
  try {
    out = YAML::LoadFile(path.string());
    return true;
  } catch (const std::exception& e) {
    error = std::string("YAML load failed: ") + e.what();
    return false;
  }
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
  if (!node || node.IsNull()) {
    return nullptr;
  }
  if (node.IsScalar()) {
    const std::string scalar = node.as<std::string>();
    // Quoted scalars keep their string type ("true" stays a string).
    if (node.Tag() == "!") {
      return scalar;
    }
    if (scalar == "true" || scalar == "True" || scalar == "yes") return true;
    if (scalar == "false" || scalar == "False" || scalar == "no") return false;
    int64_t as_int = 0;
    if (parse_int64(scalar, as_int)) {
      return as_int;
    }
    double as_double = 0.0;
    if (parse_double(scalar, as_double)) {
      return as_double;
    }
    return scalar;
  }
  if (node.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  }
  if (node.IsMap()) {
    std::vector<std::string> keys;
    keys.reserve(node.size());
    for (const auto& pair : node) {
      keys.push_back(pair.first.as<std::string>());
    }
    std::sort(keys.begin(), keys.end());
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& key : keys) {
      obj[key] = yaml_to_json(node[key]);
    }
    return obj;
  }
  return nullptr;
}
#endif

} // namespace diffgate::data
