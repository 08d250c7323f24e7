// core/document.hpp - Line-oriented text document
#pragma once

#include "../result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace scaffix {

// File content as an ordered sequence of lines without terminators.
// The terminator style and the presence of a final terminator are kept so
// that an untouched document is written back byte-for-byte.
struct TextDocument {
  std::vector<std::string> lines;
  std::string eol = "\n";
  bool trailing_newline = true;

  TextDocument() = default;
  explicit TextDocument(std::vector<std::string> l) : lines(std::move(l)) {}

  static TextDocument from_string(const std::string &text);
  std::string to_string() const;

  static Result<TextDocument> load(const fs::path &path);
  Result<void> save(const fs::path &path, bool atomic = true) const;

  bool empty() const { return lines.empty(); }
  size_t size() const { return lines.size(); }

  // Index of the first line containing needle, or npos.
  size_t find_first(const std::string &needle, size_t from = 0) const;
  bool any_line_contains(const std::string &needle) const;

  bool operator==(const TextDocument &other) const {
    return lines == other.lines;
  }
  bool operator!=(const TextDocument &other) const {
    return !(*this == other);
  }

  static constexpr size_t npos = static_cast<size_t>(-1);
};

// Splits raw text into lines. A single final terminator does not produce an
// extra empty line; "\r\n" terminators lose their '\r'.
std::vector<std::string> split_lines(const std::string &text);

} // namespace scaffix
