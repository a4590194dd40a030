#include "wau/text_io.h"

#include "wau/log.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace wau {

bool read_text_file(const std::filesystem::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    log::warn(std::string("failed to read file: ") + path.string());
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    log::warn(std::string("failed to write file: ") + path.string());
    return false;
  }
  out << contents;
  out.close();
  if (!out) {
    log::warn(std::string("write incomplete: ") + path.string());
    return false;
  }
  return true;
}

Lines split_lines(const std::string& text) {
  Lines lines;
  std::stringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

std::string join_lines(const Lines& lines) {
  std::string out;
  for (const auto& line : lines) {
    out += line;
    out += '\n';
  }
  if (lines.empty()) {
    out = "\n";
  }
  return out;
}

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace wau
