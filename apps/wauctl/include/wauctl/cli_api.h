#pragma once

#include "wau/patch_commands.h"
#include "wau/paths.h"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

struct CliOptions {
  std::string command;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> style_path;
  std::optional<std::filesystem::path> config_backup;
  std::optional<std::filesystem::path> style_backup;
  std::vector<std::string> browsers;
  bool dry_run = false;
  bool yes = false;
  bool verbose = false;
};

void print_usage(std::ostream& out);
// Returns false with an empty error when only usage was requested.
bool parse_cli(int argc, char** argv, CliOptions& opts, std::string& error);
bool confirm_changes(const std::vector<std::filesystem::path>& paths, std::istream& in, std::ostream& out);

wau::PatchTargets resolve_targets(const CliOptions& opts,
                                  const wau::ToolSettings& settings,
                                  const wau::ResolvedPaths& paths);

int run_command(const CliOptions& opts, const wau::ResolvedPaths& paths, std::istream& in, std::ostream& out);
