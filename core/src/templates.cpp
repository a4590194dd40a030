#include "wau/templates.h"

#include "wau/log.h"
#include "wau/text_io.h"

#include <system_error>

namespace wau {

namespace {
const char* const kBuiltinConfig = R"jsonc(// Waybar module definitions for the AI usage monitors.
{
  "modules-left": ["custom/claude-usage", "custom/codex-usage"],

  "custom/claude-usage": {
    "exec": "{{bin_dir}}/waybar-claude-usage --waybar",
    "return-type": "json",
    "interval": 120,
    "format": "{}",
    "tooltip": true,
    "on-click": "{{bin_dir}}/waybar-claude-usage --waybar",
    "signal": 9
  },

  "custom/codex-usage": {
    "exec": "{{bin_dir}}/waybar-codex-usage --waybar",
    "return-type": "json",
    "interval": 120,
    "format": "{}",
    "tooltip": true,
    "on-click": "{{bin_dir}}/waybar-codex-usage --waybar",
    "signal": 10
  }
}
)jsonc";

const char* const kBuiltinStyle = R"css(/* AI Usage Monitor Styling */
#custom-claude-usage,
#custom-codex-usage {
  padding: 0 8px;
  margin: 0 4px;
  border-radius: 6px;
}

#custom-claude-usage.claude-low,
#custom-codex-usage.codex-low {
  color: #a6e3a1;
}

#custom-claude-usage.claude-mid,
#custom-codex-usage.codex-mid {
  color: #f9e2af;
}

#custom-claude-usage.claude-high,
#custom-codex-usage.codex-high {
  color: #fab387;
}

/* AI Usage Monitor: error state */
#custom-claude-usage.critical,
#custom-codex-usage.critical {
  color: #ff5555;
}
)css";

bool read_template_file(const std::filesystem::path& path, std::string& out, std::string& error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    error = "template not found: " + path.string();
    return false;
  }
  if (!read_text_file(path, out)) {
    error = "template unreadable: " + path.string();
    return false;
  }
  return true;
}
} // namespace

FileTemplateSource::FileTemplateSource(std::filesystem::path dir) : dir_(std::move(dir)) {}

bool FileTemplateSource::config_text(std::string& out, std::string& error) const {
  return read_template_file(dir_ / kConfigFile, out, error);
}

bool FileTemplateSource::style_text(std::string& out, std::string& error) const {
  return read_template_file(dir_ / kStyleFile, out, error);
}

std::string FileTemplateSource::describe() const {
  return dir_.string();
}

bool FileTemplateSource::available() const {
  std::error_code ec;
  return std::filesystem::exists(dir_ / kConfigFile, ec) && std::filesystem::exists(dir_ / kStyleFile, ec);
}

bool BuiltinTemplateSource::config_text(std::string& out, std::string&) const {
  out = kBuiltinConfig;
  return true;
}

bool BuiltinTemplateSource::style_text(std::string& out, std::string&) const {
  out = kBuiltinStyle;
  return true;
}

std::string BuiltinTemplateSource::describe() const {
  return "<builtin>";
}

InMemoryTemplateSource::InMemoryTemplateSource(std::string config, std::string style)
    : config_(std::move(config)), style_(std::move(style)) {}

bool InMemoryTemplateSource::config_text(std::string& out, std::string&) const {
  out = config_;
  return true;
}

bool InMemoryTemplateSource::style_text(std::string& out, std::string&) const {
  out = style_;
  return true;
}

std::string InMemoryTemplateSource::describe() const {
  return "<memory>";
}

std::string apply_substitutions(const std::string& text, const Substitutions& substitutions) {
  std::string out = text;
  for (const auto& [placeholder, value] : substitutions) {
    if (placeholder.empty()) continue;
    std::string replaced;
    size_t pos = 0;
    while (true) {
      const size_t hit = out.find(placeholder, pos);
      if (hit == std::string::npos) {
        replaced.append(out, pos, std::string::npos);
        break;
      }
      replaced.append(out, pos, hit - pos);
      replaced += value;
      pos = hit + placeholder.size();
    }
    out = std::move(replaced);
  }
  return out;
}

bool load_module_template(const TemplateSource& source,
                          const Substitutions& substitutions,
                          const RegionMarkers& markers,
                          ModuleTemplate& out,
                          std::string& error) {
  std::string config_text;
  std::string style_text;
  if (!source.config_text(config_text, error) || !source.style_text(style_text, error)) {
    return false;
  }

  std::string parse_error;
  if (!parse_config_document(apply_substitutions(config_text, substitutions), out.config, parse_error)) {
    error = "template parse failed: " + source.describe() + " (" + parse_error + ")";
    return false;
  }

  out.style_region = extract_region(split_lines(style_text), markers);
  if (out.style_region.empty()) {
    log::warn("template style has no managed region: " + source.describe());
  }
  return true;
}

} // namespace wau
