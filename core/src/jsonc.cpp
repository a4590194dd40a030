#include "wau/jsonc.h"

#include "wau/log.h"
#include "wau/text_io.h"

#include <algorithm>
#include <cctype>

namespace wau {

namespace {
// Returns the index just past a comment starting at i, or i when none starts there.
size_t skip_comment(const std::string& text, size_t i) {
  if (i + 1 >= text.size() || text[i] != '/') {
    return i;
  }
  if (text[i + 1] == '/') {
    const size_t nl = text.find('\n', i + 2);
    return nl == std::string::npos ? text.size() : nl;
  }
  if (text[i + 1] == '*') {
    const size_t close = text.find("*/", i + 2);
    return close == std::string::npos ? text.size() : close + 2;
  }
  return i;
}

char next_significant(const std::string& text, size_t i) {
  while (i < text.size()) {
    if (std::isspace(static_cast<unsigned char>(text[i]))) {
      ++i;
      continue;
    }
    const size_t after = skip_comment(text, i);
    if (after != i) {
      i = after;
      continue;
    }
    return text[i];
  }
  return '\0';
}
} // namespace

std::string strip_trailing_commas(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '"') {
      const size_t begin = i++;
      while (i < text.size() && text[i] != '"') {
        i += (text[i] == '\\') ? 2 : 1;
      }
      i = std::min(i + 1, text.size());
      out.append(text, begin, i - begin);
      continue;
    }
    const size_t after = skip_comment(text, i);
    if (after != i) {
      out.append(text, i, after - i);
      i = after;
      continue;
    }
    if (c == ',') {
      const char next = next_significant(text, i + 1);
      if (next == '}' || next == ']') {
        ++i;
        continue;
      }
    }
    out.push_back(c);
    ++i;
  }
  return out;
}

bool parse_config_document(const std::string& text, ConfigDocument& out, std::string& error) {
  if (is_blank(text)) {
    out = ConfigDocument::object();
    return true;
  }
  try {
    out = ConfigDocument::parse(strip_trailing_commas(text), nullptr, true, true);
  } catch (const std::exception& e) {
    error = e.what();
    return false;
  }
  if (!out.is_object()) {
    error = "top-level value is not an object";
    return false;
  }
  return true;
}

bool load_config_document(const std::filesystem::path& path, ConfigDocument& out, std::string& error) {
  std::string text;
  if (!read_text_file(path, text)) {
    error = "read failed";
    return false;
  }
  if (!parse_config_document(text, out, error)) {
    log::error("JSONC parse failed: " + path.string() + " (" + error + ")");
    return false;
  }
  return true;
}

std::string dump_config_document(const ConfigDocument& doc) {
  return doc.dump(2) + "\n";
}

} // namespace wau
