// core/document.cpp - Text document implementation
#include "document.hpp"
#include "../utils.hpp"

namespace scaffix {

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  if (text.empty()) {
    return lines;
  }

  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    std::string line = (nl == std::string::npos)
                           ? text.substr(start)
                           : text.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
    if (nl == std::string::npos) {
      break;
    }
    start = nl + 1;
  }
  return lines;
}

TextDocument TextDocument::from_string(const std::string &text) {
  TextDocument doc;
  doc.lines = split_lines(text);
  if (text.find("\r\n") != std::string::npos) {
    doc.eol = "\r\n";
  }
  doc.trailing_newline = text.empty() || text.back() == '\n';
  return doc;
}

std::string TextDocument::to_string() const {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    out += lines[i];
    if (i + 1 < lines.size() || trailing_newline) {
      out += eol;
    }
  }
  return out;
}

Result<TextDocument> TextDocument::load(const fs::path &path) {
  auto text = read_text_file(path);
  if (!text) {
    return text.error();
  }
  LOG_DEBUG("Loaded " + path.string());
  return from_string(text.value());
}

Result<void> TextDocument::save(const fs::path &path, bool atomic) const {
  auto written = write_text_file(path, to_string(), atomic);
  if (written) {
    LOG_DEBUG("Wrote " + path.string() + " (" + std::to_string(lines.size()) +
              " lines)");
  }
  return written;
}

size_t TextDocument::find_first(const std::string &needle, size_t from) const {
  for (size_t i = from; i < lines.size(); ++i) {
    if (contains(lines[i], needle)) {
      return i;
    }
  }
  return npos;
}

bool TextDocument::any_line_contains(const std::string &needle) const {
  return find_first(needle) != npos;
}

} // namespace scaffix
