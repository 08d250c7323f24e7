// core/marker_insert.cpp - Content insertion implementation
#include "marker_insert.hpp"
#include "../utils.hpp"
#include <algorithm>

namespace scaffix {

TextDocument insert_after_marker(const TextDocument &doc,
                                 const std::string &marker,
                                 const std::vector<std::string> &content) {
  TextDocument out = doc;
  if (content.empty()) {
    return out;
  }

  size_t anchor = doc.find_first(marker);
  if (anchor == TextDocument::npos) {
    LOG_DEBUG("Marker '" + marker + "' not found, appending " +
              std::to_string(content.size()) + " line(s)");
    out.lines.insert(out.lines.end(), content.begin(), content.end());
    return out;
  }

  LOG_DEBUG("Inserting " + std::to_string(content.size()) +
            " line(s) after line " + std::to_string(anchor + 1));
  out.lines.insert(out.lines.begin() + static_cast<long>(anchor) + 1,
                   content.begin(), content.end());
  return out;
}

TextDocument insert_after_marker(const TextDocument &doc,
                                 const std::string &marker,
                                 const std::string &content) {
  return insert_after_marker(doc, marker, split_lines(content));
}

bool contains_block(const TextDocument &doc,
                    const std::vector<std::string> &content) {
  if (content.empty()) {
    return true;
  }
  return std::search(doc.lines.begin(), doc.lines.end(), content.begin(),
                     content.end()) != doc.lines.end();
}

TextDocument insert_once(const TextDocument &doc, const std::string &marker,
                         const std::string &content) {
  auto block = split_lines(content);
  if (contains_block(doc, block)) {
    LOG_DEBUG("Content already present, skipping insert after '" + marker +
              "'");
    return doc;
  }
  return insert_after_marker(doc, marker, block);
}

} // namespace scaffix
