#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#if DIFFGATE_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace diffgate::data {

#if DIFFGATE_ENABLE_DATA_YAML
bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out, std::string& error);

// Scalars "true"/"false" and numeric scalars become JSON booleans/numbers; map keys are sorted.
nlohmann::json yaml_to_json(const YAML::Node& node);
#endif

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error);
bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node);

// Loads a descriptor as JSON, converting YAML (.yaml/.yml) when YAML support is built in.
bool load_structured_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error);

void append_json_line(const std::filesystem::path& path, const nlohmann::json& record);

std::string read_text_file(const std::filesystem::path& path);
bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error);
bool write_text_file(const std::filesystem::path& path, const std::string& contents);

} // namespace diffgate::data
