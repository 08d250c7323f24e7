// utils.hpp - Utility functions
#pragma once

#include "result.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace scaffix {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);
  bool verbose() const { return verbose_; }

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) ::scaffix::Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) ::scaffix::Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) ::scaffix::Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) ::scaffix::Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);
Result<std::string> read_text_file(const fs::path &path);
// Writes through a sibling temp file and rename() when atomic is set.
Result<void> write_text_file(const fs::path &path, const std::string &content,
                             bool atomic = true);
Result<void> remove_path(const fs::path &path);
bool path_exists(const fs::path &path);

// String helpers
std::string trim(const std::string &s);
std::string leading_whitespace(const std::string &s);
bool contains(const std::string &haystack, const std::string &needle);

} // namespace scaffix
