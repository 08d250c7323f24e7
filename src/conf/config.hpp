// conf/config.hpp - Configuration management
#pragma once

#include "../defs.hpp"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace scaffix {

struct Config {
  // Project root every relative path is resolved against
  fs::path root = ".";
  bool verbose = false;
  bool dry_run = false;
  bool atomic_write = true;
  std::string default_indent = DEFAULT_INDENT;
  fs::path log_file;

  // <root>/.scaffix.conf if present, defaults otherwise
  static Config load_default(const fs::path &root);
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(const fs::path &root_override, bool verbose_override,
                      bool dry_run_override,
                      const std::string &indent_override);
};

} // namespace scaffix
