#include "wau/module_entries.h"

#include "wau/log.h"

#include <algorithm>

namespace wau {

namespace {
bool list_contains(const ConfigDocument& list, const std::string& entry) {
  return std::any_of(list.begin(), list.end(), [&](const ConfigDocument& item) {
    return item.is_string() && item.get<std::string>() == entry;
  });
}

bool is_managed(const ConfigDocument& item, const std::vector<std::string>& entries) {
  if (!item.is_string()) return false;
  return std::find(entries.begin(), entries.end(), item.get<std::string>()) != entries.end();
}
} // namespace

bool ensure_entries(ConfigDocument& doc, const std::string& list_key, const std::vector<std::string>& entries) {
  bool changed = false;
  if (!doc.contains(list_key) || !doc[list_key].is_array()) {
    doc[list_key] = ConfigDocument::array();
    changed = true;
  }
  auto& list = doc[list_key];
  for (const auto& entry : entries) {
    if (!list_contains(list, entry)) {
      list.push_back(entry);
      changed = true;
    }
  }
  return changed;
}

bool ensure_definitions(ConfigDocument& doc,
                        const std::vector<std::string>& entries,
                        const ConfigDocument& source_of_truth) {
  bool changed = false;
  for (const auto& entry : entries) {
    if (doc.contains(entry)) {
      continue;
    }
    if (!source_of_truth.is_object() || !source_of_truth.contains(entry)) {
      log::warn("template has no definition for " + entry);
      continue;
    }
    doc[entry] = source_of_truth[entry];
    changed = true;
  }
  return changed;
}

bool remove_entries(ConfigDocument& doc, const std::string& list_key, const std::vector<std::string>& entries) {
  if (!doc.contains(list_key) || !doc[list_key].is_array()) {
    return false;
  }
  const auto& list = doc[list_key];
  ConfigDocument kept = ConfigDocument::array();
  for (const auto& item : list) {
    if (!is_managed(item, entries)) {
      kept.push_back(item);
    }
  }
  if (kept.size() == list.size()) {
    return false;
  }
  doc[list_key] = std::move(kept);
  return true;
}

bool remove_definitions(ConfigDocument& doc, const std::vector<std::string>& entries) {
  bool changed = false;
  for (const auto& entry : entries) {
    if (doc.erase(entry) > 0) {
      changed = true;
    }
  }
  return changed;
}

bool add_browser_flags(ConfigDocument& doc,
                       const std::vector<std::string>& entries,
                       const std::vector<std::string>& browsers) {
  if (browsers.empty()) {
    return false;
  }
  std::string flags;
  for (const auto& browser : browsers) {
    if (!flags.empty()) flags += " ";
    flags += "--browser " + browser;
  }

  const std::string waybar_flag = "--waybar";
  bool changed = false;
  for (const auto& entry : entries) {
    if (!doc.contains(entry) || !doc[entry].is_object()) {
      continue;
    }
    auto& definition = doc[entry];
    if (!definition.contains("exec") || !definition["exec"].is_string()) {
      continue;
    }
    std::string exec = definition["exec"].get<std::string>();
    if (exec.find("--browser") != std::string::npos) {
      continue;
    }
    size_t pos = exec.find(waybar_flag);
    if (pos == std::string::npos) {
      continue;
    }
    const std::string inserted = " " + flags;
    while (pos != std::string::npos) {
      exec.insert(pos + waybar_flag.size(), inserted);
      pos = exec.find(waybar_flag, pos + waybar_flag.size() + inserted.size());
    }
    definition["exec"] = exec;
    changed = true;
  }
  return changed;
}

} // namespace wau
