#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace wau {

using ConfigDocument = nlohmann::ordered_json;

// Removes commas that directly precede '}' or ']' (ignoring whitespace and
// comments in between). String literals and comments are left untouched.
std::string strip_trailing_commas(const std::string& text);

// Parses JSON with comments and trailing commas into a key-ordered object.
// Whitespace-only input yields an empty object; a non-object top level is
// an error.
bool parse_config_document(const std::string& text, ConfigDocument& out, std::string& error);

bool load_config_document(const std::filesystem::path& path, ConfigDocument& out, std::string& error);

std::string dump_config_document(const ConfigDocument& doc);

} // namespace wau
