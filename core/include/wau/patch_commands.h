#pragma once

#include "wau/config.h"
#include "wau/templates.h"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace wau {

struct PatchTargets {
  std::filesystem::path config_path;
  std::filesystem::path style_path;
};

struct PatchOptions {
  bool dry_run = false;
  std::vector<std::string> browsers;
  std::optional<std::filesystem::path> config_backup;
  std::optional<std::filesystem::path> style_backup;
  // Stamp for backup names; empty means the current local time.
  std::string backup_stamp;
};

enum class FileStatus {
  Unchanged,
  Updated,
  WouldUpdate,
  Missing,
  NoBackup,
  Failed
};

struct FileReport {
  std::filesystem::path path;
  FileStatus status = FileStatus::Unchanged;
  std::filesystem::path backup_path;
};

struct CommandResult {
  bool success = false;
  std::string error_code;
  std::string error_message;
  std::vector<FileReport> files;
};

bool any_changed(const CommandResult& result);
const char* file_status_name(FileStatus status);

// Each command computes the target text of both files before touching disk,
// so a parse failure leaves everything untouched. A file is only written when
// its content changes, and only after its backup succeeded. Progress lines go
// to out.
CommandResult run_setup(const PatchTargets& targets,
                        const ToolSettings& settings,
                        const ModuleTemplate& module_template,
                        const PatchOptions& options,
                        std::ostream& out);

CommandResult run_cleanup(const PatchTargets& targets,
                          const ToolSettings& settings,
                          const PatchOptions& options,
                          std::ostream& out);

CommandResult run_restore(const PatchTargets& targets, const PatchOptions& options, std::ostream& out);

} // namespace wau
