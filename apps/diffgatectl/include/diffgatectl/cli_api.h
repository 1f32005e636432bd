#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

constexpr int kExitOk = 0;
constexpr int kExitBlocked = 1;
constexpr int kExitUsage = 2;
constexpr int kExitNoPatch = 3;

struct ApplyCommandOptions {
  std::filesystem::path scope_path;
  // "-" reads standard input.
  std::filesystem::path patch_path;
  std::optional<std::filesystem::path> repo;
  std::optional<std::filesystem::path> config;
  std::string staging;
  bool remap = false;
  bool no_fuzzy = false;
  std::optional<std::filesystem::path> json_out;
};

// "-" reads standard input.
bool read_input(const std::filesystem::path& path, std::string& out, std::string& error);

int sanitize_command(const std::filesystem::path& in_path, const std::optional<std::filesystem::path>& out_path);
int scope_check_command(const std::filesystem::path& scope_path,
                        const std::vector<std::string>& paths,
                        const std::optional<std::filesystem::path>& repo);
int scope_filter_command(const std::filesystem::path& scope_path,
                         const std::vector<std::string>& create,
                         const std::vector<std::string>& modify,
                         const std::optional<std::filesystem::path>& repo);
int validate_command(const std::filesystem::path& scope_path,
                     const std::filesystem::path& patch_path,
                     const std::optional<std::filesystem::path>& repo);
int apply_command(const ApplyCommandOptions& opts);
int status_command(const std::optional<std::filesystem::path>& repo);
