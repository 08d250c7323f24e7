// core/pattern_filter.hpp - Line removal by substring
#pragma once

#include "document.hpp"
#include <string>
#include <vector>

namespace scaffix {

// True if line contains any of the patterns (case-sensitive substring).
bool matches_any(const std::string &line,
                 const std::vector<std::string> &patterns);

// Returns doc without the lines that contain any of the patterns.
TextDocument filter_lines(const TextDocument &doc,
                          const std::vector<std::string> &patterns);

} // namespace scaffix
