// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include "defs.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace scaffix {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
      fs::create_directories(log_path.parent_path(), ec);
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
    if (!log_file_->is_open()) {
      log_file_.reset();
      std::cerr << "Cannot open log file " << log_path.string() << "\n";
    }
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S",
                std::localtime(&now));

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return fs::is_directory(path);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

bool path_exists(const fs::path &path) {
  std::error_code ec;
  // symlink_status so that dangling links still count as occupying the path
  return fs::exists(fs::symlink_status(path, ec));
}

Result<std::string> read_text_file(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Error(ErrorKind::NotFound, "file does not exist", path);
  }
  if (fs::is_directory(path, ec)) {
    return Error(ErrorKind::IOFailure, "path is a directory", path);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Error(ErrorKind::IOFailure,
                 std::string("cannot open for reading: ") + strerror(errno),
                 path);
  }

  std::ostringstream oss;
  oss << file.rdbuf();
  if (file.bad()) {
    return Error(ErrorKind::IOFailure, "read failed", path);
  }
  return oss.str();
}

static Result<void> write_stream(const fs::path &path,
                                 const std::string &content) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return Error(ErrorKind::IOFailure,
                 std::string("cannot open for writing: ") + strerror(errno),
                 path);
  }
  file << content;
  file.flush();
  if (!file.good()) {
    return Error(ErrorKind::IOFailure, "write failed", path);
  }
  return Ok();
}

Result<void> write_text_file(const fs::path &path, const std::string &content,
                             bool atomic) {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return Error(ErrorKind::IOFailure, "cannot create parent directory",
                 path.parent_path());
  }

  if (!atomic) {
    return write_stream(path, content);
  }

  // Rename replaces the link itself, so write next to the file it points at
  fs::path target = path;
  std::error_code ec;
  if (fs::is_symlink(fs::symlink_status(path, ec))) {
    target = fs::canonical(path, ec);
    if (ec) {
      return Error(ErrorKind::IOFailure,
                   "cannot resolve symlink: " + ec.message(), path);
    }
  }

  fs::path temp = target;
  temp += std::string(TEMP_FILE_SUFFIX) + std::to_string(getpid());

  auto written = write_stream(temp, content);
  if (!written) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    return written;
  }

  fs::file_status existing = fs::status(target, ec);
  if (!ec && fs::exists(existing)) {
    fs::permissions(temp, existing.permissions(), fs::perm_options::replace,
                    ec);
    if (ec) {
      std::error_code ignored;
      fs::remove(temp, ignored);
      return Error(ErrorKind::IOFailure,
                   "cannot copy permissions: " + ec.message(), target);
    }
  }
  ec.clear();

  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    return Error(ErrorKind::IOFailure, "rename failed: " + ec.message(),
                 target);
  }
  return Ok();
}

Result<void> remove_path(const fs::path &path) {
  if (!path_exists(path)) {
    return Error(ErrorKind::NotFound, "path does not exist", path);
  }
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    return Error(ErrorKind::IOFailure, "remove failed: " + ec.message(), path);
  }
  return Ok();
}

// String helpers
std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string leading_whitespace(const std::string &s) {
  auto pos = s.find_first_not_of(" \t");
  if (pos == std::string::npos) {
    return s;
  }
  return s.substr(0, pos);
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace scaffix
