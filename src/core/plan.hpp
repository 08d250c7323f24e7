// core/plan.hpp - Declarative migration plan
#pragma once

#include "validator.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace scaffix {

enum class StepKind {
  RemoveLines,   // PatternFilter
  Insert,        // MarkerInsert
  EnsureEntries, // ListBlockEditor
  DropEntries    // ListBlockEditor removal
};

struct PatchStep {
  StepKind kind = StepKind::RemoveLines;
  std::vector<std::string> patterns; // RemoveLines, DropEntries
  std::string marker;                // Insert; empty appends
  std::string content;               // Insert
  bool once = true;                  // Insert: skip if already present
  std::string opener;                // EnsureEntries
  std::vector<std::string> entries;  // EnsureEntries
  std::string indent;                // EnsureEntries; empty uses config
};

// Steps run in the order they were written, on one in-memory document.
struct FilePatch {
  fs::path path;
  bool create_missing = false;
  std::vector<PatchStep> steps;
};

struct TreeMove {
  fs::path source;
  fs::path destination;
};

struct FileCreate {
  fs::path path;
  std::string content;
  bool replace = false; // rewrite when present but different
};

struct PruneRule {
  fs::path directory;
  std::string name_contains;
};

struct MigrationPlan {
  std::string name;
  fs::path origin;
  std::vector<fs::path> directories;
  std::vector<TreeMove> merges;
  std::vector<FileCreate> creates;
  std::vector<FilePatch> patches;
  std::vector<fs::path> removals;
  std::vector<PruneRule> prunes;
  Expectations expect;

  // Relative "from"/"insert_from" paths resolve against base_dir.
  static MigrationPlan from_string(const std::string &text,
                                   const fs::path &base_dir,
                                   const std::string &origin = "<plan>");
  static MigrationPlan from_file(const fs::path &path);

  size_t action_count() const;
};

class PlanError : public std::runtime_error {
public:
  PlanError(const std::string &origin, size_t line, const std::string &what)
      : std::runtime_error(origin + ":" + std::to_string(line) + ": " + what),
        line_(line) {}

  size_t line() const { return line_; }

private:
  size_t line_;
};

} // namespace scaffix
