// core/validator.cpp - Scaffold expectation check implementation
#include "validator.hpp"
#include "../utils.hpp"
#include "document.hpp"
#include "list_block.hpp"
#include <map>
#include <optional>
#include <set>

namespace scaffix {

std::string Discrepancy::describe() const {
  switch (kind) {
  case DiscrepancyKind::MissingDirectory:
    return "Missing directory: " + path.string();
  case DiscrepancyKind::MissingFile:
    return "Missing file: " + path.string();
  case DiscrepancyKind::MissingMarker:
    return "'" + detail + "' not found in: " + path.string();
  case DiscrepancyKind::MissingBlock:
    return "List block '" + detail + "' not found in: " + path.string();
  case DiscrepancyKind::MissingEntry:
    return "List entry " + detail + " not found in: " + path.string();
  case DiscrepancyKind::UnexpectedPath:
    return "Unexpected path still present: " + path.string();
  case DiscrepancyKind::UnexpectedMarker:
    return "'" + detail + "' still present in: " + path.string();
  }
  return detail;
}

namespace {

// Loads each referenced file at most once and remembers which ones were
// already reported missing.
class DocumentCache {
public:
  DocumentCache(const fs::path &root, std::vector<Discrepancy> &out)
      : root_(root), out_(out) {}

  const TextDocument *get(const fs::path &rel) {
    auto it = docs_.find(rel);
    if (it == docs_.end()) {
      it = docs_.emplace(rel, load(rel)).first;
    }
    return it->second ? &*it->second : nullptr;
  }

  void report_missing(const fs::path &rel) {
    if (missing_.insert(rel).second) {
      out_.push_back({DiscrepancyKind::MissingFile, root_ / rel, ""});
    }
  }

private:
  std::optional<TextDocument> load(const fs::path &rel) {
    auto doc = TextDocument::load(root_ / rel);
    if (!doc) {
      LOG_DEBUG("Validator cannot read " + rel.string() + ": " +
                doc.error().describe());
      return std::nullopt;
    }
    return std::move(doc).value();
  }

  fs::path root_;
  std::vector<Discrepancy> &out_;
  std::map<fs::path, std::optional<TextDocument>> docs_;
  std::set<fs::path> missing_;
};

} // namespace

std::vector<Discrepancy> check_scaffold(const fs::path &root,
                                        const Expectations &expect) {
  std::vector<Discrepancy> out;
  DocumentCache cache(root, out);

  for (const auto &dir : expect.directories) {
    std::error_code ec;
    if (!fs::is_directory(root / dir, ec)) {
      out.push_back({DiscrepancyKind::MissingDirectory, root / dir, ""});
    }
  }

  for (const auto &file : expect.files) {
    std::error_code ec;
    if (!fs::is_regular_file(root / file, ec)) {
      cache.report_missing(file);
    }
  }

  for (const auto &m : expect.markers) {
    const TextDocument *doc = cache.get(m.file);
    if (!doc) {
      cache.report_missing(m.file);
    } else if (!doc->any_line_contains(m.marker)) {
      out.push_back({DiscrepancyKind::MissingMarker, root / m.file, m.marker});
    }
  }

  for (const auto &e : expect.entries) {
    const TextDocument *doc = cache.get(e.file);
    if (!doc) {
      cache.report_missing(e.file);
      continue;
    }
    if (!locate_block(*doc, e.opener)) {
      out.push_back({DiscrepancyKind::MissingBlock, root / e.file, e.opener});
    } else if (!has_entry(*doc, e.entry)) {
      out.push_back({DiscrepancyKind::MissingEntry, root / e.file, e.entry});
    }
  }

  for (const auto &p : expect.absent_paths) {
    if (path_exists(root / p)) {
      out.push_back({DiscrepancyKind::UnexpectedPath, root / p, ""});
    }
  }

  for (const auto &m : expect.absent_markers) {
    // A missing file cannot contain the marker
    if (!path_exists(root / m.file)) {
      continue;
    }
    const TextDocument *doc = cache.get(m.file);
    if (doc && doc->any_line_contains(m.marker)) {
      out.push_back(
          {DiscrepancyKind::UnexpectedMarker, root / m.file, m.marker});
    }
  }

  for (const auto &d : out) {
    LOG_DEBUG("Discrepancy: " + d.describe());
  }
  return out;
}

} // namespace scaffix
