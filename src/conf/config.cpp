// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../utils.hpp"
#include <fstream>
#include <stdexcept>

namespace scaffix {

static std::string strip_quotes(const std::string &value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

Config Config::load_default(const fs::path &root) {
  Config config;
  config.root = root;

  fs::path default_path = root / CONFIG_FILENAME;
  if (fs::exists(default_path)) {
    try {
      config = from_file(default_path);
      config.root = root;
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load " + default_path.string() + " (" + e.what() +
               "), using defaults");
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos || line[start] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      throw std::runtime_error(path.string() + ":" + std::to_string(line_no) +
                               ": expected 'key = value'");
    }

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = strip_quotes(trim(line.substr(eq_pos + 1)));

    if (key == "verbose")
      config.verbose = (value == "true");
    else if (key == "dry_run")
      config.dry_run = (value == "true");
    else if (key == "atomic_write")
      config.atomic_write = (value == "true");
    else if (key == "default_indent")
      config.default_indent = value;
    else if (key == "log_file")
      config.log_file = value;
    else
      LOG_WARN("Unknown config key '" + key + "' in " + path.string());
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# scaffix configuration\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  file << "dry_run = " << (dry_run ? "true" : "false") << "\n";
  file << "# Write through a temp file and rename over the target\n";
  file << "atomic_write = " << (atomic_write ? "true" : "false") << "\n";
  file << "# Indentation for list entries when the list has none to copy\n";
  file << "default_indent = \"" << default_indent << "\"\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }

  return file.good();
}

void Config::merge_with_cli(const fs::path &root_override,
                            bool verbose_override, bool dry_run_override,
                            const std::string &indent_override) {
  if (!root_override.empty()) {
    root = root_override;
  }
  if (verbose_override) {
    verbose = true;
  }
  if (dry_run_override) {
    dry_run = true;
  }
  if (!indent_override.empty()) {
    default_indent = indent_override;
  }
}

} // namespace scaffix
