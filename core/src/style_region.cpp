#include "wau/style_region.h"

#include <algorithm>

namespace wau {

namespace {
bool contains(const std::string& line, const std::string& token) {
  return !token.empty() && line.find(token) != std::string::npos;
}

bool has_closing_brace(const std::string& line) {
  return line.find('}') != std::string::npos;
}

bool matches_any(const std::string& line, const std::vector<std::string>& targets) {
  return std::any_of(targets.begin(), targets.end(),
                     [&](const std::string& t) { return contains(line, t); });
}
} // namespace

int brace_delta(const std::string& line) {
  int delta = 0;
  for (char c : line) {
    if (c == '{') ++delta;
    if (c == '}') --delta;
  }
  return delta;
}

std::optional<LineRange> locate_region(const Lines& lines, const RegionMarkers& markers) {
  std::optional<size_t> start_idx;
  std::optional<size_t> end_idx;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (!start_idx.has_value()) {
      if (contains(lines[i], markers.start_marker)) {
        start_idx = i;
      } else {
        continue;
      }
    }
    if (contains(lines[i], markers.end_marker)) {
      end_idx = i;
      break;
    }
  }
  if (!start_idx.has_value() || !end_idx.has_value()) {
    return std::nullopt;
  }

  LineRange range;
  range.start = *start_idx;
  range.end = *end_idx + 1;
  int depth = 0;
  for (size_t j = *end_idx; j < lines.size(); ++j) {
    depth += brace_delta(lines[j]);
    if (depth <= 0 && has_closing_brace(lines[j])) {
      range.end = j + 1;
      break;
    }
  }
  return range;
}

Lines extract_region(const Lines& lines, const RegionMarkers& markers) {
  const auto range = locate_region(lines, markers);
  if (!range.has_value()) {
    return {};
  }
  return Lines(lines.begin() + static_cast<std::ptrdiff_t>(range->start),
               lines.begin() + static_cast<std::ptrdiff_t>(range->end));
}

Lines inject_region(const Lines& lines, const Lines& region_lines, const RegionMarkers& markers) {
  if (region_lines.empty()) {
    return lines;
  }
  const auto range = locate_region(lines, markers);
  if (!range.has_value()) {
    Lines out = lines;
    if (!out.empty() && !is_blank(out.back())) {
      out.emplace_back();
    }
    out.insert(out.end(), region_lines.begin(), region_lines.end());
    return out;
  }
  Lines out;
  out.reserve(lines.size() + region_lines.size());
  out.insert(out.end(), lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(range->start));
  out.insert(out.end(), region_lines.begin(), region_lines.end());
  out.insert(out.end(), lines.begin() + static_cast<std::ptrdiff_t>(range->end), lines.end());
  return out;
}

Lines remove_region(const Lines& lines,
                    const RegionMarkers& markers,
                    const std::vector<std::string>& targets) {
  const auto range = locate_region(lines, markers);
  if (range.has_value()) {
    Lines out(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(range->start));
    out.insert(out.end(), lines.begin() + static_cast<std::ptrdiff_t>(range->end), lines.end());
    return out;
  }

  Lines out;
  bool skipping = false;
  int depth = 0;
  for (const auto& line : lines) {
    if (!skipping && matches_any(line, targets)) {
      skipping = true;
      depth = 0;
    }
    if (skipping) {
      depth += brace_delta(line);
      if (depth <= 0 && has_closing_brace(line)) {
        skipping = false;
      }
      continue;
    }
    out.push_back(line);
  }
  return out;
}

} // namespace wau
