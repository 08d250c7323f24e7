// core/list_block.hpp - Bracketed list editing inside structured text
#pragma once

#include "../defs.hpp"
#include "../result.hpp"
#include "document.hpp"
#include <string>
#include <vector>

namespace scaffix {

// Position of a list block. The block starts at the first line containing
// the opener; close_line is npos when no bracket could be matched.
struct BlockSpan {
  size_t open_line = TextDocument::npos;
  size_t open_col = std::string::npos;
  size_t close_line = TextDocument::npos;
  size_t close_col = std::string::npos;

  bool has_extent() const { return close_line != TextDocument::npos; }
  bool is_inline() const { return has_extent() && close_line == open_line; }
};

struct ListEditOptions {
  // Used when the block has no entry to copy indentation from
  std::string default_indent = DEFAULT_INDENT;
};

struct ListEdit {
  TextDocument document;
  std::vector<std::string> inserted;

  bool changed() const { return !inserted.empty(); }
};

Result<BlockSpan> locate_block(const TextDocument &doc,
                               const std::string &opener);

// Entry presence test shared by the editor and the validator.
bool has_entry(const TextDocument &doc, const std::string &entry);

// Adds every entry that is not yet present, as new lines right after the
// opener line. Fails with BlockNotFound if no line contains the opener.
// Running it again with the same entries leaves the document unchanged.
Result<ListEdit> ensure_entries(const TextDocument &doc,
                                const std::string &opener,
                                const std::vector<std::string> &entries,
                                const ListEditOptions &options = {});

// Drops obsolete entries: every line containing one of the patterns.
TextDocument
remove_lines_containing_any(const TextDocument &doc,
                            const std::vector<std::string> &patterns);

} // namespace scaffix
