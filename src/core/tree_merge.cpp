// core/tree_merge.cpp - Directory tree relocation implementation
#include "tree_merge.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <system_error>

namespace scaffix {

const char *merge_status_name(MergeStatus status) {
  switch (status) {
  case MergeStatus::Merged:
    return "merged";
  case MergeStatus::Partial:
    return "partial";
  case MergeStatus::NothingToMerge:
    return "nothing to merge";
  case MergeStatus::AlreadyMerged:
    return "already merged";
  }
  return "unknown";
}

static bool is_within(const fs::path &path, const fs::path &base) {
  fs::path rel = path.lexically_relative(base);
  return !rel.empty() && *rel.begin() != "..";
}

static bool under_any(const fs::path &rel,
                      const std::vector<fs::path> &blocked) {
  return std::any_of(blocked.begin(), blocked.end(),
                     [&rel](const fs::path &b) { return is_within(rel, b); });
}

// rename(), falling back to copy + remove when source and destination are
// on different filesystems.
static bool move_entry(const fs::path &from, const fs::path &to,
                       std::error_code &ec) {
  fs::rename(from, to, ec);
  if (!ec) {
    return true;
  }
  if (ec != std::errc::cross_device_link) {
    return false;
  }

  ec.clear();
  if (fs::is_symlink(fs::symlink_status(from, ec))) {
    fs::copy_symlink(from, to, ec);
  } else {
    fs::copy_file(from, to, fs::copy_options::none, ec);
  }
  if (ec) {
    return false;
  }
  fs::remove(from, ec);
  return !ec;
}

static void collect_entries(const fs::path &source,
                            std::vector<fs::path> &dirs,
                            std::vector<fs::path> &files,
                            std::error_code &ec) {
  for (auto it = fs::recursive_directory_iterator(source, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    // Symlinks are moved as links, never followed
    fs::file_status st = it->symlink_status(ec);
    if (ec) {
      return;
    }
    if (fs::is_directory(st)) {
      dirs.push_back(it->path());
    } else {
      files.push_back(it->path());
    }
  }
  // Parents sort before their children
  std::sort(dirs.begin(), dirs.end());
  std::sort(files.begin(), files.end());
}

static void prune_empty_dirs(const fs::path &source,
                             const std::vector<fs::path> &dirs,
                             MergeReport &report) {
  std::vector<fs::path> candidates(dirs.rbegin(), dirs.rend());
  candidates.push_back(source);

  for (const auto &dir : candidates) {
    std::error_code ec;
    if (!fs::is_empty(dir, ec) || ec) {
      continue;
    }
    fs::remove(dir, ec);
    if (ec) {
      report.failures.emplace_back(ErrorKind::IOFailure,
                                   "cannot remove emptied directory: " +
                                       ec.message(),
                                   dir);
      continue;
    }
    report.removed_dirs.push_back(dir);
  }
}

// A source nested inside its destination (Resources/Sources/App/Resources
// into Resources) leaves a chain of empty parents behind once it is gone.
static void prune_nested_parents(const fs::path &source,
                                 const fs::path &destination,
                                 MergeReport &report) {
  fs::path dir = source.parent_path();
  while (dir != destination && is_within(dir, destination)) {
    std::error_code ec;
    if (!fs::is_empty(dir, ec) || ec) {
      break;
    }
    fs::remove(dir, ec);
    if (ec) {
      report.failures.emplace_back(ErrorKind::IOFailure,
                                   "cannot remove emptied directory: " +
                                       ec.message(),
                                   dir);
      break;
    }
    report.removed_dirs.push_back(dir);
    dir = dir.parent_path();
  }
}

Result<MergeReport> merge_tree(const fs::path &source,
                               const fs::path &destination,
                               const MergeOptions &options) {
  MergeReport report;
  report.source = source;
  report.destination = destination;

  // not_found is reported with an error code too; only other errors fail
  std::error_code stat_ec;
  fs::file_status source_status = fs::symlink_status(source, stat_ec);
  if (stat_ec && source_status.type() != fs::file_type::not_found) {
    return Error(ErrorKind::IOFailure,
                 "cannot stat merge source: " + stat_ec.message(), source);
  }
  if (!fs::exists(source_status)) {
    report.status = path_exists(destination) ? MergeStatus::AlreadyMerged
                                             : MergeStatus::NothingToMerge;
    LOG_INFO("No directory to merge at " + source.string() + " (" +
             merge_status_name(report.status) + ")");
    return report;
  }
  stat_ec.clear();
  if (!fs::is_directory(source_status)) {
    return Error(ErrorKind::IOFailure, "merge source is not a directory",
                 source);
  }
  if (path_exists(destination)) {
    bool is_dir = fs::is_directory(destination, stat_ec);
    if (stat_ec) {
      return Error(ErrorKind::IOFailure,
                   "cannot stat merge destination: " + stat_ec.message(),
                   destination);
    }
    if (!is_dir) {
      return Error(ErrorKind::ConflictDetected,
                   "merge destination exists and is not a directory",
                   destination);
    }
  }

  std::error_code src_ec;
  std::error_code dst_ec;
  fs::path canon_src = fs::weakly_canonical(source, src_ec);
  fs::path canon_dst = fs::weakly_canonical(destination, dst_ec);
  if (src_ec || dst_ec) {
    return Error(ErrorKind::IOFailure, "cannot resolve merge paths",
                 src_ec ? source : destination);
  }
  if (canon_src == canon_dst || is_within(canon_dst, canon_src)) {
    return Error(ErrorKind::IOFailure, "merge destination lies inside source",
                 destination);
  }

  std::error_code ec;
  std::vector<fs::path> dirs;
  std::vector<fs::path> files;
  collect_entries(source, dirs, files, ec);
  if (ec) {
    return Error(ErrorKind::IOFailure,
                 "cannot enumerate merge source: " + ec.message(), source);
  }

  LOG_DEBUG("Merging " + std::to_string(files.size()) + " file(s) from " +
            source.string() + " into " + destination.string());

  // Relative directories whose destination position is taken by a file
  std::vector<fs::path> blocked;

  if (!path_exists(destination)) {
    if (!options.dry_run && !fs::create_directories(destination, ec) && ec) {
      return Error(ErrorKind::IOFailure,
                   "cannot create merge destination: " + ec.message(),
                   destination);
    }
    report.created_dirs.push_back(destination);
  }

  for (const auto &dir : dirs) {
    fs::path rel = dir.lexically_relative(source);
    fs::path target = destination / rel;
    if (under_any(rel, blocked)) {
      continue;
    }

    if (path_exists(target)) {
      std::error_code dir_ec;
      bool is_dir = fs::is_directory(target, dir_ec);
      if (dir_ec) {
        report.conflicts.emplace_back(ErrorKind::IOFailure,
                                      "cannot stat " + dir_ec.message(),
                                      target);
        blocked.push_back(rel);
      } else if (!is_dir) {
        report.conflicts.emplace_back(ErrorKind::ConflictDetected,
                                      "a file occupies a directory position",
                                      target);
        blocked.push_back(rel);
      }
      continue;
    }

    if (!options.dry_run) {
      fs::create_directory(target, ec);
      if (ec) {
        report.failures.emplace_back(
            ErrorKind::IOFailure, "cannot create directory: " + ec.message(),
            target);
        blocked.push_back(rel);
        ec.clear();
        continue;
      }
    }
    report.created_dirs.push_back(target);
  }

  for (const auto &file : files) {
    fs::path rel = file.lexically_relative(source);
    fs::path target = destination / rel;
    if (under_any(rel, blocked)) {
      continue;
    }

    if (path_exists(target)) {
      report.conflicts.emplace_back(ErrorKind::ConflictDetected,
                                    "destination file already exists", target);
      continue;
    }

    if (!options.dry_run && !move_entry(file, target, ec)) {
      report.failures.emplace_back(
          ErrorKind::IOFailure, "cannot move " + file.string() + ": " +
                                    ec.message(),
          target);
      ec.clear();
      continue;
    }
    report.moved.push_back(target);
  }

  for (const auto &conflict : report.conflicts) {
    LOG_WARN("Merge conflict: " + conflict.path.string());
  }
  for (const auto &failure : report.failures) {
    LOG_ERROR("Merge failure: " + failure.describe());
  }

  if (!options.dry_run) {
    prune_empty_dirs(source, dirs, report);
    if (!path_exists(source) && is_within(canon_src, canon_dst)) {
      prune_nested_parents(canon_src, canon_dst, report);
    }
  }

  report.status = report.ok() ? MergeStatus::Merged : MergeStatus::Partial;
  LOG_INFO(std::string(options.dry_run ? "[dry-run] " : "") + "Merged " +
           std::to_string(report.moved.size()) + " file(s) from " +
           source.string() + " into " + destination.string() + " (" +
           std::to_string(report.conflicts.size()) + " conflict(s))");
  return report;
}

} // namespace scaffix
