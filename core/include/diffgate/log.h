#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace diffgate::log {

enum class Level {
  Debug,
  Info,
  Warn,
  Error
};

// Log lines go to stderr and, once init() has run, to a timestamped file in log_dir.
// stdout stays reserved for command output.
void init();
void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();
void install_crash_handlers();

// Lines below the threshold are dropped everywhere, ring buffer included.
void set_level(Level level);
Level level();
// "debug", "info", "warn"/"warning", "error"; case-insensitive.
bool parse_level(std::string_view text, Level& out);
const char* level_name(Level level);

// Tags every following line with the run id; empty clears the tag.
void set_run_id(const std::string& run_id);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace diffgate::log
