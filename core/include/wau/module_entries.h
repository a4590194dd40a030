#pragma once

#include "wau/jsonc.h"

#include <string>
#include <vector>

namespace wau {

// Each mutator returns true when it changed doc.

// Appends missing entries to doc[list_key], keeping existing order. A
// list_key holding something other than an array is replaced by an empty
// array first.
bool ensure_entries(ConfigDocument& doc, const std::string& list_key, const std::vector<std::string>& entries);

// Copies the definition of every entry missing from doc out of the template.
bool ensure_definitions(ConfigDocument& doc,
                        const std::vector<std::string>& entries,
                        const ConfigDocument& source_of_truth);

bool remove_entries(ConfigDocument& doc, const std::string& list_key, const std::vector<std::string>& entries);
bool remove_definitions(ConfigDocument& doc, const std::vector<std::string>& entries);

// Inserts "--browser NAME" flags after every "--waybar" in the exec command
// of each entry that does not pass --browser yet.
bool add_browser_flags(ConfigDocument& doc,
                       const std::vector<std::string>& entries,
                       const std::vector<std::string>& browsers);

} // namespace wau
