#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace diffgate {

struct CommandSpec {
  // args[0] is looked up on PATH; no shell is involved.
  std::vector<std::string> args;
  std::filesystem::path cwd;
};

struct CommandResult {
  bool started = false;
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;

  bool ok() const { return started && exit_code == 0; }
  // stderr, else stdout, else the spawn error, truncated to limit bytes.
  std::string diagnostic(size_t limit) const;
};

// Runs to completion with stdin on /dev/null, capturing both output streams.
CommandResult run_command(const CommandSpec& spec);

// Human-readable rendering for logs and provenance; never executed.
std::string describe_command(const std::vector<std::string>& args);

} // namespace diffgate
