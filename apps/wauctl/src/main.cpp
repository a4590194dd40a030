#include "wau/config.h"
#include "wau/log.h"
#include "wau/patch_commands.h"
#include "wau/paths.h"
#include "wau/templates.h"
#include "wauctl/cli_api.h"

#include <cctype>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage(std::ostream& out) {
  out << "Usage:\n"
      << "  waybar-ai-usage setup [--config <path>] [--style <path>] [--browser <name>]... [--dry-run] [--yes] [--verbose]\n"
      << "  waybar-ai-usage cleanup [--config <path>] [--style <path>] [--dry-run] [--yes] [--verbose]\n"
      << "  waybar-ai-usage restore [--config <path>] [--style <path>] [--config-backup <path>] [--style-backup <path>] [--dry-run] [--yes] [--verbose]\n"
      << "\n"
      << "  setup    add the usage modules to the Waybar config and their styles to style.css\n"
      << "  cleanup  remove the usage modules and their styles\n"
      << "  restore  write back the latest (or the given) backup of each file\n"
      << "\n"
      << "Defaults: ~/.config/waybar/config.jsonc and ~/.config/waybar/style.css.\n"
      << "Every rewrite first saves <file>.bak.<timestamp> next to the file.\n";
}

bool parse_cli(int argc, char** argv, CliOptions& opts, std::string& error) {
  if (argc < 2) {
    return false;
  }
  opts.command = argv[1];
  if (opts.command == "-h" || opts.command == "--help" || opts.command == "help") {
    return false;
  }
  if (opts.command != "setup" && opts.command != "cleanup" && opts.command != "restore") {
    error = "unknown command: " + opts.command;
    return false;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      opts.config_path = fs::path(argv[++i]);
    } else if (arg == "--style" && has_value) {
      opts.style_path = fs::path(argv[++i]);
    } else if (arg == "--browser" && has_value && opts.command == "setup") {
      opts.browsers.emplace_back(argv[++i]);
    } else if (arg == "--config-backup" && has_value && opts.command == "restore") {
      opts.config_backup = fs::path(argv[++i]);
    } else if (arg == "--style-backup" && has_value && opts.command == "restore") {
      opts.style_backup = fs::path(argv[++i]);
    } else if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg == "--yes") {
      opts.yes = true;
    } else if (arg == "--verbose") {
      opts.verbose = true;
    } else {
      error = "unexpected argument for " + opts.command + ": " + arg;
      return false;
    }
  }
  return true;
}

bool confirm_changes(const std::vector<fs::path>& paths, std::istream& in, std::ostream& out) {
  out << "Note: the Waybar config will be rewritten; its formatting and comments may change.\n";
  out << "This will modify the following files:\n";
  for (const auto& path : paths) {
    out << "- " << path.string() << "\n";
  }
  out << "Proceed? [y/N] ";
  out.flush();
  std::string line;
  std::getline(in, line);
  const auto first = line.find_first_not_of(" \t");
  const auto last = line.find_last_not_of(" \t\r");
  std::string answer = first == std::string::npos ? "" : line.substr(first, last - first + 1);
  for (char& c : answer) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return answer == "y" || answer == "yes";
}

wau::PatchTargets resolve_targets(const CliOptions& opts,
                                  const wau::ToolSettings& settings,
                                  const wau::ResolvedPaths& paths) {
  wau::PatchTargets targets;
  if (opts.config_path.has_value()) {
    targets.config_path = *opts.config_path;
  } else if (!settings.config_path.empty()) {
    targets.config_path = settings.config_path;
  } else {
    targets.config_path = paths.default_config;
  }
  if (opts.style_path.has_value()) {
    targets.style_path = *opts.style_path;
  } else if (!settings.style_path.empty()) {
    targets.style_path = settings.style_path;
  } else {
    targets.style_path = paths.default_style;
  }
  targets.config_path = wau::expand_user(targets.config_path);
  targets.style_path = wau::expand_user(targets.style_path);
  return targets;
}

namespace {
std::unique_ptr<wau::TemplateSource> select_template_source(const wau::ResolvedPaths& paths) {
  auto files = std::make_unique<wau::FileTemplateSource>(paths.templates_dir);
  if (files->available()) {
    return files;
  }
  wau::log::info("using builtin templates; none found in " + paths.templates_dir.string());
  return std::make_unique<wau::BuiltinTemplateSource>();
}

int finish(const std::string& command, const wau::CommandResult& result, std::ostream& out) {
  for (const auto& file : result.files) {
    wau::log::info(command + " " + file.path.string() + ": " + wau::file_status_name(file.status));
  }
  if (!result.success) {
    out << "Error: " << result.error_message << "\n";
    return 1;
  }
  return 0;
}
} // namespace

int run_command(const CliOptions& opts, const wau::ResolvedPaths& paths, std::istream& in, std::ostream& out) {
  const wau::ToolSettings settings = wau::load_tool_settings(paths.settings_path);
  const wau::PatchTargets targets = resolve_targets(opts, settings, paths);

  wau::PatchOptions patch_opts;
  patch_opts.dry_run = opts.dry_run;
  patch_opts.browsers = opts.browsers.empty() ? settings.browsers : opts.browsers;
  if (opts.config_backup.has_value()) patch_opts.config_backup = wau::expand_user(*opts.config_backup);
  if (opts.style_backup.has_value()) patch_opts.style_backup = wau::expand_user(*opts.style_backup);

  wau::log::info("command: " + opts.command + " config=" + targets.config_path.string() +
                 " style=" + targets.style_path.string() + (opts.dry_run ? " (dry-run)" : ""));

  wau::ModuleTemplate module_template;
  if (opts.command == "setup") {
    const auto source = select_template_source(paths);
    const wau::Substitutions substitutions = {{"{{bin_dir}}", paths.bin_dir.string()}};
    std::string error;
    if (!wau::load_module_template(*source, substitutions, wau::style_markers(settings), module_template, error)) {
      wau::log::error(error);
      out << "Error: " << error << "\n";
      return 1;
    }
  }

  if (!opts.yes && !opts.dry_run) {
    if (!confirm_changes({targets.config_path, targets.style_path}, in, out)) {
      out << "Aborted.\n";
      wau::log::info("approval denied");
      return 0;
    }
  }

  if (opts.command == "setup") {
    return finish(opts.command, wau::run_setup(targets, settings, module_template, patch_opts, out), out);
  }
  if (opts.command == "cleanup") {
    return finish(opts.command, wau::run_cleanup(targets, settings, patch_opts, out), out);
  }
  return finish(opts.command, wau::run_restore(targets, patch_opts, out), out);
}

#ifndef WAUCTL_LIB
int main(int argc, char** argv) {
  CliOptions opts;
  std::string error;
  if (!parse_cli(argc, argv, opts, error)) {
    print_usage(std::cout);
    if (error.empty()) {
      return 0;
    }
    std::cerr << error << "\n";
    return 1;
  }

  wau::log::set_verbose(opts.verbose);
  const auto paths = wau::resolve_paths(argc > 0 ? argv[0] : nullptr);
  wau::log::init("waybar-ai-usage", paths.logs_dir);
  wau::log::install_crash_handlers();

  const int rc = run_command(opts, paths, std::cin, std::cout);
  wau::log::shutdown();
  return rc;
}
#endif
