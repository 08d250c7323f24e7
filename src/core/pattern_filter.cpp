// core/pattern_filter.cpp - Line removal implementation
#include "pattern_filter.hpp"
#include "../utils.hpp"
#include <algorithm>

namespace scaffix {

bool matches_any(const std::string &line,
                 const std::vector<std::string> &patterns) {
  return std::any_of(
      patterns.begin(), patterns.end(),
      [&line](const std::string &pattern) { return contains(line, pattern); });
}

TextDocument filter_lines(const TextDocument &doc,
                          const std::vector<std::string> &patterns) {
  TextDocument out = doc;
  if (patterns.empty()) {
    return out;
  }

  out.lines.erase(std::remove_if(out.lines.begin(), out.lines.end(),
                                 [&patterns](const std::string &line) {
                                   return matches_any(line, patterns);
                                 }),
                  out.lines.end());

  size_t removed = doc.lines.size() - out.lines.size();
  if (removed > 0) {
    LOG_DEBUG("Filtered " + std::to_string(removed) + " line(s)");
  }
  return out;
}

} // namespace scaffix
