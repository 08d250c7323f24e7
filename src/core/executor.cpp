// core/executor.cpp - Migration plan execution implementation
#include "executor.hpp"
#include "../utils.hpp"
#include "list_block.hpp"
#include "marker_insert.hpp"
#include "pattern_filter.hpp"
#include <algorithm>

namespace scaffix {

bool ExecutionResult::ok() const {
  return failures.empty() &&
         std::all_of(merges.begin(), merges.end(),
                     [](const MergeReport &m) { return m.ok(); });
}

static std::string prefix(const Config &config) {
  return config.dry_run ? "[dry-run] " : "";
}

Result<TextDocument> apply_steps(const TextDocument &doc,
                                 const std::vector<PatchStep> &steps,
                                 const Config &config) {
  TextDocument current = doc;

  for (const auto &step : steps) {
    switch (step.kind) {
    case StepKind::RemoveLines:
      current = filter_lines(current, step.patterns);
      break;
    case StepKind::DropEntries:
      current = remove_lines_containing_any(current, step.patterns);
      break;
    case StepKind::Insert: {
      auto block = split_lines(step.content);
      if (step.once && contains_block(current, block)) {
        LOG_DEBUG("Snippet already present, skipping insert");
        break;
      }
      if (step.marker.empty()) {
        current.lines.insert(current.lines.end(), block.begin(), block.end());
      } else {
        current = insert_after_marker(current, step.marker, block);
      }
      break;
    }
    case StepKind::EnsureEntries: {
      ListEditOptions options;
      options.default_indent =
          step.indent.empty() ? config.default_indent : step.indent;
      auto edit = ensure_entries(current, step.opener, step.entries, options);
      if (!edit) {
        return edit.error();
      }
      current = std::move(edit).value().document;
      break;
    }
    }
  }
  return current;
}

static void make_directories(const MigrationPlan &plan, const Config &config,
                             ExecutionResult &result) {
  for (const auto &dir : plan.directories) {
    fs::path target = config.root / dir;
    if (path_exists(target)) {
      if (!fs::is_directory(target)) {
        result.failures.emplace_back(ErrorKind::ConflictDetected,
                                     "a file occupies the directory path",
                                     target);
      }
      continue;
    }
    if (!config.dry_run && !ensure_dir_exists(target)) {
      result.failures.emplace_back(ErrorKind::IOFailure,
                                   "cannot create directory", target);
      continue;
    }
    LOG_INFO(prefix(config) + "Created directory " + target.string());
    result.created_paths.push_back(target);
  }
}

static void run_merges(const MigrationPlan &plan, const Config &config,
                       ExecutionResult &result) {
  MergeOptions options;
  options.dry_run = config.dry_run;

  for (const auto &move : plan.merges) {
    auto report = merge_tree(config.root / move.source,
                             config.root / move.destination, options);
    if (!report) {
      LOG_ERROR(report.error().describe());
      result.failures.push_back(report.error());
      continue;
    }
    result.merges.push_back(std::move(report).value());
  }
}

static void create_files(const MigrationPlan &plan, const Config &config,
                         ExecutionResult &result) {
  for (const auto &create : plan.creates) {
    fs::path target = config.root / create.path;
    bool exists = path_exists(target);

    if (exists) {
      if (!create.replace) {
        LOG_DEBUG(target.string() + " already exists, leaving it");
        continue;
      }
      auto current = read_text_file(target);
      if (!current) {
        LOG_ERROR(current.error().describe());
        result.failures.push_back(current.error());
        continue;
      }
      if (current.value() == create.content) {
        LOG_DEBUG(target.string() + " is up to date");
        continue;
      }
    }

    if (!config.dry_run) {
      auto written =
          write_text_file(target, create.content, config.atomic_write);
      if (!written) {
        LOG_ERROR(written.error().describe());
        result.failures.push_back(written.error());
        continue;
      }
    }
    LOG_INFO(prefix(config) + (exists ? "Updated " : "Created ") +
             target.string());
    (exists ? result.changed_files : result.created_paths).push_back(target);
  }
}

static void patch_files(const MigrationPlan &plan, const Config &config,
                        ExecutionResult &result) {
  for (const auto &patch : plan.patches) {
    fs::path target = config.root / patch.path;

    auto loaded = TextDocument::load(target);
    bool created = false;
    TextDocument original;
    if (loaded) {
      original = std::move(loaded).value();
    } else if (loaded.error().kind == ErrorKind::NotFound &&
               patch.create_missing) {
      created = true;
    } else if (loaded.error().kind == ErrorKind::NotFound) {
      LOG_WARN("File not found, skipping: " + target.string());
      result.warnings.push_back(loaded.error());
      continue;
    } else {
      LOG_ERROR(loaded.error().describe());
      result.failures.push_back(loaded.error());
      continue;
    }

    auto patched = apply_steps(original, patch.steps, config);
    if (!patched) {
      Error error = patched.error();
      error.path = target;
      LOG_ERROR("Not patching " + target.string() + ": " + error.message);
      result.failures.push_back(error);
      continue;
    }

    const TextDocument &doc = patched.value();
    if (!created && doc == original) {
      LOG_DEBUG(target.string() + " unchanged");
      continue;
    }

    if (!config.dry_run) {
      auto saved = doc.save(target, config.atomic_write);
      if (!saved) {
        LOG_ERROR(saved.error().describe());
        result.failures.push_back(saved.error());
        continue;
      }
    }
    LOG_INFO(prefix(config) + "Patched " + target.string());
    (created ? result.created_paths : result.changed_files).push_back(target);
  }
}

static void remove_paths(const MigrationPlan &plan, const Config &config,
                         ExecutionResult &result) {
  for (const auto &rel : plan.removals) {
    fs::path target = config.root / rel;
    if (!path_exists(target)) {
      LOG_INFO("Already removed: " + target.string());
      continue;
    }
    if (!config.dry_run) {
      auto removed = remove_path(target);
      if (!removed) {
        LOG_ERROR(removed.error().describe());
        result.failures.push_back(removed.error());
        continue;
      }
    }
    LOG_INFO(prefix(config) + "Removed " + target.string());
    result.removed_paths.push_back(target);
  }
}

static void prune_directories(const MigrationPlan &plan, const Config &config,
                              ExecutionResult &result) {
  for (const auto &rule : plan.prunes) {
    fs::path dir = config.root / rule.directory;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
      LOG_WARN("Directory not found, nothing to prune: " + dir.string());
      result.warnings.emplace_back(ErrorKind::NotFound,
                                   "directory does not exist", dir);
      continue;
    }

    std::vector<fs::path> victims;
    try {
      for (const auto &entry : fs::directory_iterator(dir)) {
        if (contains(entry.path().filename().string(), rule.name_contains)) {
          victims.push_back(entry.path());
        }
      }
    } catch (const fs::filesystem_error &e) {
      result.failures.emplace_back(ErrorKind::IOFailure,
                                   std::string("cannot list directory: ") +
                                       e.what(),
                                   dir);
      continue;
    }
    std::sort(victims.begin(), victims.end());

    for (const auto &victim : victims) {
      if (!config.dry_run) {
        auto removed = remove_path(victim);
        if (!removed) {
          LOG_ERROR(removed.error().describe());
          result.failures.push_back(removed.error());
          continue;
        }
      }
      LOG_INFO(prefix(config) + "Removed " + victim.string());
      result.removed_paths.push_back(victim);
    }
  }
}

ExecutionResult execute_plan(const MigrationPlan &plan, const Config &config) {
  LOG_INFO(prefix(config) + "Applying plan '" + plan.name + "' to " +
           config.root.string());

  ExecutionResult result;
  make_directories(plan, config, result);
  run_merges(plan, config, result);
  create_files(plan, config, result);
  patch_files(plan, config, result);
  remove_paths(plan, config, result);
  prune_directories(plan, config, result);

  LOG_INFO("Plan '" + plan.name + "': " +
           std::to_string(result.changed_files.size()) + " changed, " +
           std::to_string(result.created_paths.size()) + " created, " +
           std::to_string(result.removed_paths.size()) + " removed, " +
           std::to_string(result.failures.size()) + " failure(s)");
  return result;
}

std::vector<Discrepancy> validate_plan(const MigrationPlan &plan,
                                       const Config &config) {
  if (plan.expect.empty()) {
    LOG_WARN("Plan '" + plan.name + "' has no [expect] section");
  }
  return check_scaffold(config.root, plan.expect);
}

} // namespace scaffix
