#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace wau {

using Lines = std::vector<std::string>;

bool read_text_file(const std::filesystem::path& path, std::string& out);
bool write_text_file(const std::filesystem::path& path, const std::string& contents);

// Splits on '\n' (a trailing '\r' is dropped); a final newline does not
// produce an empty trailing line.
Lines split_lines(const std::string& text);

// Inverse of split_lines for documents this tool writes: every line,
// including the last, is terminated by '\n'.
std::string join_lines(const Lines& lines);

bool is_blank(const std::string& line);

} // namespace wau
