// core/tree_merge.hpp - Directory tree relocation
#pragma once

#include "../result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace scaffix {

enum class MergeStatus {
  Merged,         // every file moved, source removed
  Partial,        // conflicts or failures left files under source
  NothingToMerge, // neither source nor destination exists
  AlreadyMerged   // source gone, destination present
};

const char *merge_status_name(MergeStatus status);

struct MergeOptions {
  bool dry_run = false;
};

struct MergeReport {
  fs::path source;
  fs::path destination;
  MergeStatus status = MergeStatus::NothingToMerge;
  std::vector<fs::path> moved;           // destination paths
  std::vector<fs::path> created_dirs;    // destination directories
  std::vector<fs::path> removed_dirs;    // emptied source directories
  std::vector<Error> conflicts;          // ConflictDetected, one per path
  std::vector<Error> failures;           // IOFailure, one per path

  bool ok() const { return conflicts.empty() && failures.empty(); }
};

// Moves every file under source to the same relative path under
// destination. Existing destination files are never overwritten: each
// collision is reported as ConflictDetected and both copies stay in place.
// Directories emptied by the move are removed, deepest first.
Result<MergeReport> merge_tree(const fs::path &source,
                               const fs::path &destination,
                               const MergeOptions &options = {});

} // namespace scaffix
