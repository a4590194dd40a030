#pragma once

#include "wau/jsonc.h"
#include "wau/style_region.h"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace wau {

// Provides the example config/style pair that setup installs from.
class TemplateSource {
 public:
  virtual ~TemplateSource() = default;
  virtual bool config_text(std::string& out, std::string& error) const = 0;
  virtual bool style_text(std::string& out, std::string& error) const = 0;
  virtual std::string describe() const = 0;
};

class FileTemplateSource : public TemplateSource {
 public:
  explicit FileTemplateSource(std::filesystem::path dir);

  bool config_text(std::string& out, std::string& error) const override;
  bool style_text(std::string& out, std::string& error) const override;
  std::string describe() const override;

  bool available() const;

  static constexpr const char* kConfigFile = "waybar-config-example.jsonc";
  static constexpr const char* kStyleFile = "waybar-style-example.css";

 private:
  std::filesystem::path dir_;
};

// The same pair compiled into the binary.
class BuiltinTemplateSource : public TemplateSource {
 public:
  bool config_text(std::string& out, std::string& error) const override;
  bool style_text(std::string& out, std::string& error) const override;
  std::string describe() const override;
};

class InMemoryTemplateSource : public TemplateSource {
 public:
  InMemoryTemplateSource(std::string config, std::string style);

  bool config_text(std::string& out, std::string& error) const override;
  bool style_text(std::string& out, std::string& error) const override;
  std::string describe() const override;

 private:
  std::string config_;
  std::string style_;
};

struct ModuleTemplate {
  ConfigDocument config;
  Lines style_region;
};

using Substitutions = std::vector<std::pair<std::string, std::string>>;

// Replaces every occurrence of each placeholder, applying the pairs in order.
std::string apply_substitutions(const std::string& text, const Substitutions& substitutions);

bool load_module_template(const TemplateSource& source,
                          const Substitutions& substitutions,
                          const RegionMarkers& markers,
                          ModuleTemplate& out,
                          std::string& error);

} // namespace wau
