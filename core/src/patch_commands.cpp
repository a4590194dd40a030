#include "wau/patch_commands.h"

#include "wau/backup.h"
#include "wau/jsonc.h"
#include "wau/log.h"
#include "wau/module_entries.h"
#include "wau/style_region.h"
#include "wau/text_io.h"

#include <algorithm>
#include <system_error>

namespace wau {
namespace fs = std::filesystem;

namespace {
struct PlannedWrite {
  fs::path path;
  bool exists = false;
  bool changed = false;
  std::string contents;
};

void report(std::ostream& out, const std::string& line) {
  out << line << "\n";
  log::info(line);
}

bool file_exists(const fs::path& path) {
  std::error_code ec;
  return fs::exists(path, ec) && !ec;
}

void fail(CommandResult& result, const std::string& code, const std::string& message) {
  result.success = false;
  result.error_code = code;
  result.error_message = message;
  log::error(message);
}

std::string stamp_for(const PatchOptions& options) {
  return options.backup_stamp.empty() ? backup_timestamp() : options.backup_stamp;
}

bool load_existing_config(const fs::path& path, ConfigDocument& doc, CommandResult& result) {
  std::string error;
  if (!load_config_document(path, doc, error)) {
    fail(result, "config_parse_failed", "Failed to parse JSONC: " + path.string() + " (" + error + ")");
    return false;
  }
  return true;
}

bool load_style_lines(const fs::path& path, Lines& lines, CommandResult& result) {
  std::string text;
  if (!read_text_file(path, text)) {
    fail(result, "read_failed", "Failed to read: " + path.string());
    return false;
  }
  lines = split_lines(text);
  return true;
}

// Backs up an existing file, then writes the planned contents.
void commit(const PlannedWrite& plan, const PatchOptions& options, CommandResult& result, std::ostream& out) {
  FileReport file;
  file.path = plan.path;
  if (!plan.changed) {
    report(out, "No changes needed in: " + plan.path.string());
    result.files.push_back(file);
    return;
  }
  if (options.dry_run) {
    report(out, "[dry-run] Would update: " + plan.path.string());
    file.status = FileStatus::WouldUpdate;
    result.files.push_back(file);
    return;
  }

  if (plan.exists) {
    const auto backup = backup_file(plan.path, stamp_for(options));
    if (!backup.success) {
      fail(result, backup.error_code, "Backup failed, not writing " + plan.path.string() + ": " + backup.error_message);
      file.status = FileStatus::Failed;
      result.files.push_back(file);
      return;
    }
    file.backup_path = backup.backup_path;
    report(out, "Backup created: " + backup.backup_path.string());
  } else if (plan.path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(plan.path.parent_path(), ec);
  }

  if (!write_text_file(plan.path, plan.contents)) {
    fail(result, "write_failed", "Failed to write: " + plan.path.string());
    file.status = FileStatus::Failed;
    result.files.push_back(file);
    return;
  }
  report(out, "Updated: " + plan.path.string());
  file.status = FileStatus::Updated;
  result.files.push_back(file);
}

// Replaces the managed region (or one under a legacy marker pair), or
// appends a new one.
Lines place_style_region(const Lines& lines, const Lines& region, const ToolSettings& settings) {
  const RegionMarkers markers = style_markers(settings);
  if (!locate_region(lines, markers).has_value()) {
    for (const auto& legacy : settings.legacy_style_markers) {
      if (locate_region(lines, legacy).has_value()) {
        log::info("replacing style region marked " + legacy.start_marker);
        return inject_region(lines, region, legacy);
      }
    }
  }
  return inject_region(lines, region, markers);
}

Lines strip_style_regions(const Lines& lines, const ToolSettings& settings) {
  Lines out = lines;
  for (const auto& legacy : settings.legacy_style_markers) {
    out = remove_region(out, legacy, {});
  }
  return remove_region(out, style_markers(settings), style_targets(settings));
}

void report_missing(const char* label, const fs::path& path, CommandResult& result, std::ostream& out) {
  report(out, std::string(label) + " not found: " + path.string());
  FileReport file;
  file.path = path;
  file.status = FileStatus::Missing;
  result.files.push_back(file);
}

void restore_one(const fs::path& path,
                 const std::optional<fs::path>& explicit_backup,
                 const PatchOptions& options,
                 CommandResult& result,
                 std::ostream& out) {
  FileReport file;
  file.path = path;

  std::optional<fs::path> backup = explicit_backup;
  if (backup.has_value()) {
    if (!file_exists(*backup)) {
      report(out, "Backup not found: " + backup->string());
      file.status = FileStatus::NoBackup;
      result.files.push_back(file);
      return;
    }
  } else {
    backup = latest_backup(path);
    if (!backup.has_value()) {
      report(out, "No backup found for: " + path.string());
      file.status = FileStatus::NoBackup;
      result.files.push_back(file);
      return;
    }
  }

  std::string backup_text;
  if (!read_text_file(*backup, backup_text)) {
    fail(result, "read_failed", "Failed to read backup: " + backup->string());
    file.status = FileStatus::Failed;
    result.files.push_back(file);
    return;
  }
  const bool exists = file_exists(path);
  std::string current_text;
  if (exists && !read_text_file(path, current_text)) {
    fail(result, "read_failed", "Failed to read: " + path.string());
    file.status = FileStatus::Failed;
    result.files.push_back(file);
    return;
  }
  if (exists && current_text == backup_text) {
    report(out, "No changes needed in: " + path.string());
    result.files.push_back(file);
    return;
  }

  if (options.dry_run) {
    report(out, "[dry-run] Would restore: " + path.string() + " from " + backup->string());
    file.status = FileStatus::WouldUpdate;
    result.files.push_back(file);
    return;
  }

  const auto restored = restore_backup(path, *backup, stamp_for(options));
  if (!restored.success) {
    fail(result, restored.error_code, "Restore failed for " + path.string() + ": " + restored.error_message);
    file.status = FileStatus::Failed;
    result.files.push_back(file);
    return;
  }
  if (!restored.backup_taken.empty()) {
    report(out, "Backup created: " + restored.backup_taken.string());
  }
  report(out, "Restored: " + path.string() + " from " + backup->string());
  file.status = FileStatus::Updated;
  file.backup_path = restored.backup_taken;
  result.files.push_back(file);
}
} // namespace

bool any_changed(const CommandResult& result) {
  return std::any_of(result.files.begin(), result.files.end(), [](const FileReport& f) {
    return f.status == FileStatus::Updated || f.status == FileStatus::WouldUpdate;
  });
}

const char* file_status_name(FileStatus status) {
  switch (status) {
    case FileStatus::Unchanged:
      return "unchanged";
    case FileStatus::Updated:
      return "updated";
    case FileStatus::WouldUpdate:
      return "would_update";
    case FileStatus::Missing:
      return "missing";
    case FileStatus::NoBackup:
      return "no_backup";
    case FileStatus::Failed:
      return "failed";
  }
  return "unknown";
}

CommandResult run_setup(const PatchTargets& targets,
                        const ToolSettings& settings,
                        const ModuleTemplate& module_template,
                        const PatchOptions& options,
                        std::ostream& out) {
  CommandResult result;

  PlannedWrite config_plan;
  config_plan.path = targets.config_path;
  config_plan.exists = file_exists(targets.config_path);
  ConfigDocument doc = ConfigDocument::object();
  if (config_plan.exists && !load_existing_config(targets.config_path, doc, result)) {
    return result;
  }
  bool config_changed = ensure_entries(doc, settings.list_key, settings.modules);
  config_changed = ensure_definitions(doc, settings.modules, module_template.config) || config_changed;
  config_changed = add_browser_flags(doc, settings.modules, options.browsers) || config_changed;
  config_plan.changed = config_changed;
  config_plan.contents = dump_config_document(doc);

  PlannedWrite style_plan;
  style_plan.path = targets.style_path;
  style_plan.exists = file_exists(targets.style_path);
  Lines style_lines;
  if (style_plan.exists && !load_style_lines(targets.style_path, style_lines, result)) {
    return result;
  }
  const Lines updated_style = place_style_region(style_lines, module_template.style_region, settings);
  style_plan.changed = updated_style != style_lines;
  style_plan.contents = join_lines(updated_style);

  result.success = true;
  commit(config_plan, options, result, out);
  commit(style_plan, options, result, out);
  return result;
}

CommandResult run_cleanup(const PatchTargets& targets,
                          const ToolSettings& settings,
                          const PatchOptions& options,
                          std::ostream& out) {
  CommandResult result;

  PlannedWrite config_plan;
  config_plan.path = targets.config_path;
  config_plan.exists = file_exists(targets.config_path);
  if (config_plan.exists) {
    ConfigDocument doc;
    if (!load_existing_config(targets.config_path, doc, result)) {
      return result;
    }
    bool config_changed = remove_entries(doc, settings.list_key, settings.modules);
    config_changed = remove_definitions(doc, settings.modules) || config_changed;
    config_plan.changed = config_changed;
    config_plan.contents = dump_config_document(doc);
  }

  PlannedWrite style_plan;
  style_plan.path = targets.style_path;
  style_plan.exists = file_exists(targets.style_path);
  if (style_plan.exists) {
    Lines style_lines;
    if (!load_style_lines(targets.style_path, style_lines, result)) {
      return result;
    }
    const Lines updated_style = strip_style_regions(style_lines, settings);
    style_plan.changed = updated_style != style_lines;
    style_plan.contents = join_lines(updated_style);
  }

  result.success = true;
  if (config_plan.exists) {
    commit(config_plan, options, result, out);
  } else {
    report_missing("Config", config_plan.path, result, out);
  }
  if (style_plan.exists) {
    commit(style_plan, options, result, out);
  } else {
    report_missing("Style", style_plan.path, result, out);
  }
  return result;
}

CommandResult run_restore(const PatchTargets& targets, const PatchOptions& options, std::ostream& out) {
  CommandResult result;
  result.success = true;
  restore_one(targets.config_path, options.config_backup, options, result, out);
  restore_one(targets.style_path, options.style_backup, options, result, out);
  return result;
}

} // namespace wau
