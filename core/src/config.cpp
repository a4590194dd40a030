#include "wau/config.h"

#include "wau/log.h"

#include <nlohmann/json.hpp>

#if WAU_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

#include <fstream>
#include <optional>

namespace wau {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct SettingsFields {
  std::string list_key;
  std::vector<std::string> modules;
  std::string start_marker;
  std::string end_marker;
  std::vector<std::string> targets;
  std::string config_path;
  std::string style_path;
  std::optional<std::vector<std::string>> browsers;
};

void apply_fields(ToolSettings& cfg, const SettingsFields& f) {
  if (!f.list_key.empty()) cfg.list_key = f.list_key;
  if (!f.modules.empty()) cfg.modules = f.modules;
  if (!f.start_marker.empty()) cfg.style_start_marker = f.start_marker;
  if (!f.end_marker.empty()) cfg.style_end_marker = f.end_marker;
  if (!f.targets.empty()) cfg.style_targets = f.targets;
  if (!f.config_path.empty()) cfg.config_path = f.config_path;
  if (!f.style_path.empty()) cfg.style_path = f.style_path;
  if (f.browsers.has_value()) cfg.browsers = *f.browsers;
}
} // namespace

ToolSettings load_tool_settings(const std::filesystem::path& path) {
  ToolSettings cfg;

  if (path.empty() || !file_exists(path)) {
    log::info(std::string("settings not found, using defaults: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    std::ifstream in(path);
    nlohmann::json j;
    SettingsFields f;
    try {
      in >> j;
      const auto& root = j.contains("waybar_ai_usage") ? j["waybar_ai_usage"] : j;

      auto read_list = [](const nlohmann::json& node) {
        std::vector<std::string> out;
        for (const auto& v : node) {
          if (v.is_string()) out.push_back(v.get<std::string>());
        }
        return out;
      };
      if (root.contains("list_key")) f.list_key = root["list_key"].get<std::string>();
      if (root.contains("modules") && root["modules"].is_array()) f.modules = read_list(root["modules"]);
      if (root.contains("style") && root["style"].is_object()) {
        const auto& style = root["style"];
        if (style.contains("start_marker")) f.start_marker = style["start_marker"].get<std::string>();
        if (style.contains("end_marker")) f.end_marker = style["end_marker"].get<std::string>();
        if (style.contains("targets") && style["targets"].is_array()) f.targets = read_list(style["targets"]);
      }
      if (root.contains("config_path")) f.config_path = root["config_path"].get<std::string>();
      if (root.contains("style_path")) f.style_path = root["style_path"].get<std::string>();
      if (root.contains("browsers") && root["browsers"].is_array()) f.browsers = read_list(root["browsers"]);
    } catch (const std::exception& e) {
      log::warn(std::string("settings parse failed, using defaults: ") + e.what());
      return cfg;
    }

    apply_fields(cfg, f);
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if WAU_ENABLE_DATA_YAML
    SettingsFields f;
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["waybar_ai_usage"] ? doc["waybar_ai_usage"] : doc;

      auto read_list = [](const YAML::Node& node) {
        std::vector<std::string> out;
        for (const auto& v : node) {
          out.push_back(v.as<std::string>());
        }
        return out;
      };
      if (root["list_key"]) f.list_key = root["list_key"].as<std::string>();
      if (root["modules"]) f.modules = read_list(root["modules"]);
      if (root["style"]) {
        const auto style = root["style"];
        if (style["start_marker"]) f.start_marker = style["start_marker"].as<std::string>();
        if (style["end_marker"]) f.end_marker = style["end_marker"].as<std::string>();
        if (style["targets"]) f.targets = read_list(style["targets"]);
      }
      if (root["config_path"]) f.config_path = root["config_path"].as<std::string>();
      if (root["style_path"]) f.style_path = root["style_path"].as<std::string>();
      if (root["browsers"]) f.browsers = read_list(root["browsers"]);
    } catch (const YAML::Exception& e) {
      log::warn(std::string("settings parse failed, using defaults: ") + e.what());
      return cfg;
    }

    apply_fields(cfg, f);
#else
    log::warn("YAML settings requested but YAML support is disabled.");
#endif
    return cfg;
  }

  log::warn("Unknown settings extension; using defaults.");
  return cfg;
}

RegionMarkers style_markers(const ToolSettings& settings) {
  return RegionMarkers{settings.style_start_marker, settings.style_end_marker};
}

std::vector<std::string> style_targets(const ToolSettings& settings) {
  if (!settings.style_targets.empty()) {
    return settings.style_targets;
  }
  std::vector<std::string> out;
  for (const auto& module : settings.modules) {
    out.push_back(selector_for_module(module));
  }
  return out;
}

std::string selector_for_module(const std::string& module) {
  std::string id = module;
  for (char& c : id) {
    if (c == '/') c = '-';
  }
  return "#" + id;
}

} // namespace wau
