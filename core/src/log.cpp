#include "diffgate/log.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace diffgate::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::filesystem::path g_log_path;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "diffgate";
std::string g_run_id;
#ifdef DIFFGATE_DEBUG
Level g_level = Level::Debug;
#else
Level g_level = Level::Info;
#endif

std::tm local_now() {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

std::string format_now(const char* pattern) {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

void log_line(Level lvl, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (lvl < g_level) return;
  std::string line = "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + level_name(lvl) + "]";
  if (!g_run_id.empty()) {
    line += "[" + g_run_id + "]";
  }
  line += " ";
  line += msg;
  std::cerr << line << "\n";
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(std::move(line));
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init() {
  init("diffgate", std::filesystem::current_path() / "build" / "logs");
}

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    g_run_id.clear();
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    g_log_path.clear();
  }
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  if (ec) {
    log_line(Level::Warn, "log dir unavailable: " + log_dir.string() + ": " + ec.message());
    return;
  }
  const auto path = log_dir / (app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log");
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file.open(path, std::ios::out | std::ios::app);
    if (g_log_file.is_open()) {
      g_log_path = path;
    }
  }
  if (g_log_path.empty()) {
    log_line(Level::Warn, "cannot open log file " + path.string());
  } else {
    log_line(Level::Debug, app_name + " logging to " + path.string());
  }
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_run_id.clear();
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_level(Level lvl) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_level = lvl;
}

Level level() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  return g_level;
}

bool parse_level(std::string_view text, Level& out) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") {
    out = Level::Debug;
  } else if (lower == "info") {
    out = Level::Info;
  } else if (lower == "warn" || lower == "warning") {
    out = Level::Warn;
  } else if (lower == "error") {
    out = Level::Error;
  } else {
    return false;
  }
  return true;
}

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    case Level::Error:
      return "ERROR";
  }
  return "INFO";
}

void set_run_id(const std::string& run_id) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_run_id = run_id;
}

void debug(std::string_view msg) {
  log_line(Level::Debug, msg);
}

void info(std::string_view msg) {
  log_line(Level::Info, msg);
}

void warn(std::string_view msg) {
  log_line(Level::Warn, msg);
}

void error(std::string_view msg) {
  log_line(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - count, g_ring.end());
}

namespace {
// Async-signal context: no locking, write what we can and leave.
void signal_handler(int sig) {
  std::cerr << "[" << g_app_name << "] crash signal " << sig << "\n";
  if (g_log_file.is_open()) {
    g_log_file << "[ERROR] crash signal " << sig << "\n";
    g_log_file.flush();
  }
  std::_Exit(128 + sig);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
  std::signal(SIGBUS, signal_handler);
}

} // namespace diffgate::log
