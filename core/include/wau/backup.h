#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wau {

struct BackupResult {
  bool success = false;
  std::filesystem::path backup_path;
  std::string error_code;
  std::string error_message;
};

struct RestoreResult {
  bool success = false;
  std::filesystem::path backup_taken;  // empty when the target did not exist
  std::string error_code;
  std::string error_message;
};

// Local time, second resolution: YYYYmmdd-HHMMSS.
std::string backup_timestamp();

// <file>.bak.<stamp>
std::filesystem::path backup_path_for(const std::filesystem::path& path, const std::string& stamp);

// Copies path to a new sibling named after stamp. An existing backup with the
// same stamp is never overwritten; a two-digit counter suffix is added instead.
BackupResult backup_file(const std::filesystem::path& path, const std::string& stamp = backup_timestamp());

// Backups of path, oldest first (lexicographic order of the suffix).
std::vector<std::filesystem::path> list_backups(const std::filesystem::path& path);
std::optional<std::filesystem::path> latest_backup(const std::filesystem::path& path);

// Backs up the current content of path (when present), then overwrites path
// with the content of backup_path.
RestoreResult restore_backup(const std::filesystem::path& path,
                             const std::filesystem::path& backup_path,
                             const std::string& stamp = backup_timestamp());

} // namespace wau
