#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wau::log {

void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();
void install_crash_handlers();

// INFO lines are echoed to stderr only when verbose; WARN/ERROR always are.
void set_verbose(bool verbose);

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace wau::log
