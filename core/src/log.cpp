#include "wau/log.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace wau::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "wau";
bool g_verbose = false;

std::tm local_now() {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

std::string timestamp_now() {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string timestamp_for_filename() {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return oss.str();
}

void log_line(const char* level, std::string_view msg, bool echo) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + timestamp_now() + "][" + level + "] " + std::string(msg);
  if (echo) {
    std::cerr << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  g_app_name = app_name;
  if (!log_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (!ec) {
      const std::filesystem::path log_path = log_dir / (g_app_name + "_" + timestamp_for_filename() + ".log");
      g_log_file.open(log_path, std::ios::out | std::ios::app);
    }
  }
  log_line("INFO", "log init", g_verbose);
#ifdef WAU_DEBUG
  log_line("INFO", "build: debug", g_verbose);
#else
  log_line("INFO", "build: release", g_verbose);
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown", g_verbose);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_verbose(bool verbose) {
  g_verbose = verbose;
}

void info(std::string_view msg) {
  log_line("INFO", msg, g_verbose);
}

void warn(std::string_view msg) {
  log_line("WARN", msg, true);
}

void error(std::string_view msg) {
  log_line("ERROR", msg, true);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

namespace {
void signal_handler(int sig) {
  log_line("ERROR", std::string("crash signal: ") + std::to_string(sig), true);
  std::_Exit(1);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

} // namespace wau::log
