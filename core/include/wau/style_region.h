#pragma once

#include "wau/text_io.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wau {

struct RegionMarkers {
  std::string start_marker;
  std::string end_marker;
};

// Half-open line range [start, end).
struct LineRange {
  size_t start = 0;
  size_t end = 0;
};

// Finds the first start marker, then the first end marker at or after it,
// then extends past the end marker until the running brace depth closes on
// a line holding '}'. Markers are substring matches. An unterminated pair
// (start without a later end) is reported as absent.
std::optional<LineRange> locate_region(const Lines& lines, const RegionMarkers& markers);

Lines extract_region(const Lines& lines, const RegionMarkers& markers);

// Replaces the located region with region_lines, or appends them (after a
// blank separator when the last line is not blank). An empty region_lines
// returns the input unchanged.
Lines inject_region(const Lines& lines, const Lines& region_lines, const RegionMarkers& markers);

// Splices out exactly the located region; surrounding lines, including a
// separator left by inject_region, are kept. Without a marker pair, drops
// every brace-delimited block whose header line contains one of targets.
Lines remove_region(const Lines& lines,
                    const RegionMarkers& markers,
                    const std::vector<std::string>& targets);

int brace_delta(const std::string& line);

} // namespace wau
