#include "diffgate_data/serialization.h"

#include "diffgate/log.h"

#include <fstream>
#include <sstream>

namespace diffgate::data {

std::string read_text_file(const std::filesystem::path& path) {
  std::string out;
  std::string error;
  if (!read_text_file(path, out, error)) {
    diffgate::log::warn(error);
    return {};
  }
  return out;
}

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "failed to read file: " + path.string();
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    diffgate::log::warn(std::string("failed to write file: ") + path.string());
    return false;
  }
  out << contents;
  return static_cast<bool>(out);
}

void append_json_line(const std::filesystem::path& path, const nlohmann::json& record) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::app);
  if (!out) {
    diffgate::log::warn(std::string("failed to append: ") + path.string());
    return;
  }
  out << record.dump() << "\n";
}

} // namespace diffgate::data
