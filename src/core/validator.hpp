// core/validator.hpp - Read-only scaffold expectation check
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace scaffix {

struct MarkerExpectation {
  fs::path file;
  std::string marker;
};

struct EntryExpectation {
  fs::path file;
  std::string opener;
  std::string entry;
};

// All paths are relative to the root passed to check_scaffold.
struct Expectations {
  std::vector<fs::path> directories;
  std::vector<fs::path> files;
  std::vector<MarkerExpectation> markers;
  std::vector<EntryExpectation> entries;
  // Used to confirm a rollback
  std::vector<fs::path> absent_paths;
  std::vector<MarkerExpectation> absent_markers;

  bool empty() const {
    return directories.empty() && files.empty() && markers.empty() &&
           entries.empty() && absent_paths.empty() && absent_markers.empty();
  }
};

enum class DiscrepancyKind {
  MissingDirectory,
  MissingFile,
  MissingMarker,
  MissingBlock,
  MissingEntry,
  UnexpectedPath,
  UnexpectedMarker
};

struct Discrepancy {
  DiscrepancyKind kind;
  fs::path path;
  std::string detail;

  std::string describe() const;
};

// Reports every expectation that does not hold, in declaration order grouped
// by kind. Never modifies the tree. A missing file is reported once even if
// several expectations refer to it.
std::vector<Discrepancy> check_scaffold(const fs::path &root,
                                        const Expectations &expect);

} // namespace scaffix
