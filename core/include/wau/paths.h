#pragma once

#include <filesystem>

namespace wau {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path bin_dir;
  std::filesystem::path templates_dir;
  std::filesystem::path settings_path;
  std::filesystem::path logs_dir;
  std::filesystem::path default_config;
  std::filesystem::path default_style;
};

ResolvedPaths resolve_paths(const char* argv0);

// Expands a leading "~" from $HOME.
std::filesystem::path expand_user(const std::filesystem::path& path);

} // namespace wau
