#include "wau/backup.h"

#include "wau/log.h"
#include "wau/text_io.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace wau {
namespace fs = std::filesystem;

namespace {
constexpr int kMaxSameSecondBackups = 99;

std::string backup_prefix(const fs::path& path) {
  return path.filename().string() + ".bak.";
}

bool path_exists(const fs::path& path) {
  std::error_code ec;
  return fs::exists(path, ec) && !ec;
}
} // namespace

std::string backup_timestamp() {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
  return oss.str();
}

fs::path backup_path_for(const fs::path& path, const std::string& stamp) {
  fs::path out = path;
  out += ".bak." + stamp;
  return out;
}

BackupResult backup_file(const fs::path& path, const std::string& stamp) {
  BackupResult result;
  std::string contents;
  if (!read_text_file(path, contents)) {
    result.error_code = "read_failed";
    result.error_message = "cannot read " + path.string();
    return result;
  }

  fs::path target = backup_path_for(path, stamp);
  int attempt = 0;
  while (path_exists(target)) {
    if (++attempt > kMaxSameSecondBackups) {
      result.error_code = "backup_failed";
      result.error_message = "too many backups within one second for " + path.string();
      return result;
    }
    std::ostringstream suffix;
    suffix << "." << std::setw(2) << std::setfill('0') << attempt;
    target = backup_path_for(path, stamp + suffix.str());
  }

  if (!write_text_file(target, contents)) {
    result.error_code = "backup_failed";
    result.error_message = "cannot write " + target.string();
    return result;
  }
  log::info("backup written: " + target.string());
  result.success = true;
  result.backup_path = target;
  return result;
}

std::vector<fs::path> list_backups(const fs::path& path) {
  std::vector<fs::path> out;
  fs::path dir = path.parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  const std::string prefix = backup_prefix(path);
  std::error_code ec;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;
    const std::string name = it->path().filename().string();
    if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
      out.push_back(path.parent_path() / name);
    }
  }
  std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() < b.filename().string();
  });
  return out;
}

std::optional<fs::path> latest_backup(const fs::path& path) {
  const auto backups = list_backups(path);
  if (backups.empty()) {
    return std::nullopt;
  }
  return backups.back();
}

RestoreResult restore_backup(const fs::path& path, const fs::path& backup_path, const std::string& stamp) {
  RestoreResult result;
  std::string contents;
  if (!path_exists(backup_path) || !read_text_file(backup_path, contents)) {
    result.error_code = "read_failed";
    result.error_message = "cannot read backup " + backup_path.string();
    return result;
  }

  if (path_exists(path)) {
    const auto backup = backup_file(path, stamp);
    if (!backup.success) {
      result.error_code = backup.error_code;
      result.error_message = backup.error_message;
      return result;
    }
    result.backup_taken = backup.backup_path;
  }

  if (!write_text_file(path, contents)) {
    result.error_code = "write_failed";
    result.error_message = "cannot write " + path.string();
    return result;
  }
  log::info("restored " + path.string() + " from " + backup_path.string());
  result.success = true;
  return result;
}

} // namespace wau
