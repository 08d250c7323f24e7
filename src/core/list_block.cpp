// core/list_block.cpp - List block editing implementation
#include "list_block.hpp"
#include "../utils.hpp"
#include "pattern_filter.hpp"
#include <algorithm>

namespace scaffix {

static char closing_for(char open) {
  switch (open) {
  case '[':
    return ']';
  case '(':
    return ')';
  case '{':
    return '}';
  default:
    return '\0';
  }
}

// Column of the bracket that opens the block on the opener line.
// Prefer the last bracket inside the opener text itself ("resources: ["),
// otherwise the first one following it ("dependencies:" + " [").
static size_t find_open_bracket(const std::string &line, size_t opener_pos,
                                size_t opener_len) {
  size_t last = line.find_last_of("[({", opener_pos + opener_len - 1);
  if (last != std::string::npos && last >= opener_pos) {
    return last;
  }
  return line.find_first_of("[({", opener_pos + opener_len);
}

// Walks forward from the opening bracket until its partner closes.
// Brackets inside double-quoted strings and after "//" are ignored.
static void match_close(const TextDocument &doc, BlockSpan &span) {
  const std::string &first = doc.lines[span.open_line];
  char open = first[span.open_col];
  char close = closing_for(open);
  int depth = 0;
  bool in_string = false;

  for (size_t ln = span.open_line; ln < doc.lines.size(); ++ln) {
    const std::string &line = doc.lines[ln];
    size_t col = (ln == span.open_line) ? span.open_col : 0;
    bool escaped = false;

    for (; col < line.size(); ++col) {
      char c = line[col];
      if (in_string) {
        if (escaped)
          escaped = false;
        else if (c == '\\')
          escaped = true;
        else if (c == '"')
          in_string = false;
        continue;
      }
      if (c == '"') {
        in_string = true;
      } else if (c == '/' && col + 1 < line.size() && line[col + 1] == '/') {
        break;
      } else if (c == open) {
        ++depth;
      } else if (c == close) {
        if (--depth == 0) {
          span.close_line = ln;
          span.close_col = col;
          return;
        }
      }
    }
    // Swift/C-like string literals do not span lines
    in_string = false;
  }
}

Result<BlockSpan> locate_block(const TextDocument &doc,
                               const std::string &opener) {
  BlockSpan span;
  span.open_line = doc.find_first(opener);
  if (span.open_line == TextDocument::npos) {
    return Error(ErrorKind::BlockNotFound,
                 "no line contains list opener '" + opener + "'");
  }

  const std::string &line = doc.lines[span.open_line];
  size_t opener_pos = line.find(opener);
  span.open_col = find_open_bracket(line, opener_pos, opener.size());
  if (span.open_col != std::string::npos) {
    match_close(doc, span);
  }
  return span;
}

bool has_entry(const TextDocument &doc, const std::string &entry) {
  std::string needle = trim(entry);
  if (needle.empty()) {
    return true;
  }
  return doc.any_line_contains(needle);
}

static std::string sibling_indent(const TextDocument &doc,
                                  const BlockSpan &span,
                                  const std::string &fallback) {
  if (!span.has_extent() || span.is_inline()) {
    return fallback;
  }
  for (size_t ln = span.open_line + 1; ln < span.close_line; ++ln) {
    if (!trim(doc.lines[ln]).empty()) {
      return leading_whitespace(doc.lines[ln]);
    }
  }
  return fallback;
}

Result<ListEdit> ensure_entries(const TextDocument &doc,
                                const std::string &opener,
                                const std::vector<std::string> &entries,
                                const ListEditOptions &options) {
  auto located = locate_block(doc, opener);
  if (!located) {
    return located.error();
  }
  const BlockSpan &span = located.value();

  ListEdit edit;
  for (const auto &raw : entries) {
    // An entry spanning lines is stored as one entry per line
    for (const auto &part : split_lines(raw)) {
      std::string entry = trim(part);
      if (entry.empty() || has_entry(doc, entry) ||
          std::find(edit.inserted.begin(), edit.inserted.end(), entry) !=
              edit.inserted.end()) {
        continue;
      }
      edit.inserted.push_back(entry);
    }
  }

  if (!edit.changed()) {
    LOG_DEBUG("List '" + opener + "' already has all entries");
    edit.document = doc;
    return edit;
  }

  std::string indent = sibling_indent(doc, span, options.default_indent);
  std::vector<std::string> new_lines;
  for (const auto &entry : edit.inserted) {
    new_lines.push_back(indent + entry);
  }

  edit.document = doc;
  std::vector<std::string> &lines = edit.document.lines;
  auto at = lines.begin() + static_cast<long>(span.open_line);

  if (span.is_inline()) {
    // "exclude: []" becomes a multi-line block so entries get their own lines
    std::string original = *at;
    std::string head = original.substr(0, span.open_col + 1);
    std::string inner = trim(original.substr(
        span.open_col + 1, span.close_col - span.open_col - 1));
    std::string tail = original.substr(span.close_col);

    if (!inner.empty()) {
      new_lines.push_back(indent + inner);
    }
    new_lines.push_back(leading_whitespace(original) + tail);
    *at = head;
    LOG_DEBUG("Expanded inline list '" + opener + "'");
  }

  lines.insert(at + 1, new_lines.begin(), new_lines.end());
  LOG_DEBUG("Added " + std::to_string(edit.inserted.size()) +
            " entry(ies) to list '" + opener + "'");
  return edit;
}

TextDocument
remove_lines_containing_any(const TextDocument &doc,
                            const std::vector<std::string> &patterns) {
  return filter_lines(doc, patterns);
}

} // namespace scaffix
