#include "wau/paths.h"

#include "wau/log.h"

#include <cstdlib>
#include <string>

#include <unistd.h>

namespace wau {

namespace fs = std::filesystem;

namespace {
fs::path home_dir() {
  if (const char* home = std::getenv("HOME")) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path xdg_dir(const char* env_name, const char* fallback) {
  if (const char* env = std::getenv(env_name)) {
    if (env[0] != '\0') {
      return fs::path(env);
    }
  }
  return home_dir() / fallback;
}

fs::path executable_dir(const char* argv0) {
  char buffer[4096];
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len > 0) {
    buffer[len] = '\0';
    return fs::path(buffer).parent_path();
  }
  if (argv0) {
    return fs::absolute(argv0).parent_path();
  }
  return fs::current_path();
}

bool has_templates(const fs::path& dir) {
  std::error_code ec;
  return fs::exists(dir / "templates" / "waybar-style-example.css", ec);
}

// Source tree or build dir: <root>/templates. Installed: <prefix>/share/waybar-ai-usage/templates.
fs::path find_root_from(const fs::path& start) {
  fs::path cur = start;
  for (int i = 0; i < 6; ++i) {
    if (has_templates(cur)) {
      return cur;
    }
    const fs::path share = cur / "share" / "waybar-ai-usage";
    if (has_templates(share)) {
      return share;
    }
    if (cur.has_parent_path() && cur.parent_path() != cur) {
      cur = cur.parent_path();
    } else {
      break;
    }
  }
  return start;
}

fs::path find_settings(const fs::path& dir) {
  for (const char* name : {"settings.yaml", "settings.yml", "settings.json"}) {
    std::error_code ec;
    if (fs::exists(dir / name, ec)) {
      return dir / name;
    }
  }
  return dir / "settings.yaml";
}
} // namespace

fs::path expand_user(const fs::path& path) {
  const std::string text = path.string();
  if (text == "~") {
    return home_dir();
  }
  if (text.size() > 1 && text[0] == '~' && text[1] == '/') {
    return home_dir() / text.substr(2);
  }
  return path;
}

ResolvedPaths resolve_paths(const char* argv0) {
  ResolvedPaths out;
  out.bin_dir = executable_dir(argv0);
  if (const char* env_root = std::getenv("WAU_ROOT")) {
    out.root = fs::path(env_root);
  } else {
    out.root = find_root_from(out.bin_dir);
  }

  if (const char* env_templates = std::getenv("WAU_TEMPLATES_DIR")) {
    out.templates_dir = fs::path(env_templates);
  } else {
    out.templates_dir = out.root / "templates";
  }

  const fs::path config_home = xdg_dir("XDG_CONFIG_HOME", ".config");
  out.settings_path = find_settings(config_home / "waybar-ai-usage");
  out.logs_dir = xdg_dir("XDG_CACHE_HOME", ".cache") / "waybar-ai-usage" / "logs";
  out.default_config = config_home / "waybar" / "config.jsonc";
  out.default_style = config_home / "waybar" / "style.css";

  std::error_code ec;
  if (!fs::exists(out.templates_dir, ec)) {
    log::info("bundled templates not found: " + out.templates_dir.string());
  }
  return out;
}

} // namespace wau
