#pragma once

#include "wau/style_region.h"

#include <filesystem>
#include <string>
#include <vector>

namespace wau {

struct ToolSettings {
  std::string list_key = "modules-left";
  std::vector<std::string> modules = {"custom/claude-usage", "custom/codex-usage"};
  std::string style_start_marker = "/* AI Usage Monitor Styling */";
  std::string style_end_marker = "/* AI Usage Monitor: error state */";
  // Marker pairs written by earlier releases. setup replaces such a region
  // when the current pair is absent; cleanup removes it.
  std::vector<RegionMarkers> legacy_style_markers = {
      {"/* Claude Code Usage Monitor Styling */", "/* Error state (network failures, auth errors, etc.) */"}};
  // Fallback selector tokens for cleanup; empty means derived from modules.
  std::vector<std::string> style_targets;
  std::string config_path;
  std::string style_path;
  std::vector<std::string> browsers;
};

ToolSettings load_tool_settings(const std::filesystem::path& path);

RegionMarkers style_markers(const ToolSettings& settings);
std::vector<std::string> style_targets(const ToolSettings& settings);

// Waybar CSS id of a module name: "custom/claude-usage" -> "#custom-claude-usage".
std::string selector_for_module(const std::string& module);

} // namespace wau
