// core/marker_insert.hpp - Content insertion after an anchor line
#pragma once

#include "document.hpp"
#include <string>
#include <vector>

namespace scaffix {

// Inserts content right after the first line containing marker, or at the
// end of the document when no line does. Multi-line content is split into
// lines first. Not idempotent: a second call inserts a second copy.
TextDocument insert_after_marker(const TextDocument &doc,
                                 const std::string &marker,
                                 const std::string &content);
TextDocument insert_after_marker(const TextDocument &doc,
                                 const std::string &marker,
                                 const std::vector<std::string> &content);

// True if the content lines already occur as a contiguous run in doc.
bool contains_block(const TextDocument &doc,
                    const std::vector<std::string> &content);

// insert_after_marker guarded by contains_block.
TextDocument insert_once(const TextDocument &doc, const std::string &marker,
                         const std::string &content);

} // namespace scaffix
