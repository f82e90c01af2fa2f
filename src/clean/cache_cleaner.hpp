#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace devtask::clean {

// What a clean pass removes, relative to one root directory.
//
// - fixed_paths: removed recursively when present, ignored when missing
// - directory_patterns: fnmatch(3) globs matched against directory names
//   anywhere under the root; a matching directory is removed whole
// - excluded_roots: never removed and never descended into, nor is anything
//   beneath them (e.g. a virtual environment's own __pycache__ folders)
struct CleanPlan {
  std::vector<std::filesystem::path> fixed_paths;
  std::vector<std::string> directory_patterns;
  std::vector<std::filesystem::path> excluded_roots;
};

struct CleanReport {
  std::vector<std::filesystem::path> removed;
  std::vector<std::filesystem::path> skipped_excluded;
};

// The plan used by the `clean` task: tool caches, build output and every
// `__pycache__` outside `.venv`.
CleanPlan DefaultCleanPlan();

// True when `path` equals or lies inside one of `excluded_roots`. Both sides are
// compared lexically after normalization.
bool IsExcluded(const std::filesystem::path& path,
                const std::vector<std::filesystem::path>& excluded_roots);

// Removes every directory under `root` whose name matches `pattern`, skipping
// excluded roots. Symlinked directories are not followed and unreadable
// directories are skipped. Appends removed paths to `removed`. An error while
// scanning or removing does not stop removal of the other matches; it is
// reported once the pass is over.
bool RemoveMatchingDirectories(const std::filesystem::path& root, const std::string& pattern,
                               const std::vector<std::filesystem::path>& excluded_roots,
                               std::vector<std::filesystem::path>& removed, std::string& error);

// Applies `plan` under `root`. Stops at the first I/O error.
bool ExecuteCleanPlan(const std::filesystem::path& root, const CleanPlan& plan,
                      CleanReport& report, std::string& error);

} // namespace devtask::clean
