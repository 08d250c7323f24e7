// core/executor.hpp - Migration plan execution
#pragma once

#include "../conf/config.hpp"
#include "../result.hpp"
#include "document.hpp"
#include "plan.hpp"
#include "tree_merge.hpp"
#include "validator.hpp"
#include <string>
#include <vector>

namespace scaffix {

struct ExecutionResult {
  std::vector<fs::path> changed_files;
  std::vector<fs::path> created_paths;
  std::vector<fs::path> removed_paths;
  std::vector<MergeReport> merges;
  std::vector<Error> warnings; // recoverable, e.g. a file to patch is absent
  std::vector<Error> failures;

  bool ok() const;
};

// Runs one file's steps on a document in memory. The first failing step
// aborts the whole sequence.
Result<TextDocument> apply_steps(const TextDocument &doc,
                                 const std::vector<PatchStep> &steps,
                                 const Config &config);

// Phases run in a fixed order: mkdir, merges, creates, file patches,
// removals, prunes. A failure in one item does not stop independent items.
ExecutionResult execute_plan(const MigrationPlan &plan, const Config &config);

std::vector<Discrepancy> validate_plan(const MigrationPlan &plan,
                                       const Config &config);

} // namespace scaffix
