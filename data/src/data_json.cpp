#include "diffgate_data/serialization.h"

#include "diffgate/log.h"

#include <fstream>

namespace diffgate::data {

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "JSON read failed: " + path.string();
    return false;
  }
  try {
    in >> out;
  } catch (const std::exception& e) {
    error = std::string("JSON parse failed: ") + e.what();
    return false;
  }
  return true;
}

bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node) {
  return write_text_file(path, node.dump(2) + "\n");
}

bool load_structured_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    error = "file not found: " + path.string();
    return false;
  }
  const auto ext = path.extension().string();
  if (ext == ".yaml" || ext == ".yml") {
#if DIFFGATE_ENABLE_DATA_YAML
    YAML::Node node;
    if (!load_yaml_file(path, node, error)) {
      return false;
    }
    out = yaml_to_json(node);
    return true;
#else
    error = "YAML descriptor requested but YAML support is disabled: " + path.string();
    return false;
#endif
  }
  return load_json_file(path, out, error);
}

} // namespace diffgate::data
