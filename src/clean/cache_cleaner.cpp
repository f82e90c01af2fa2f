#include "clean/cache_cleaner.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include <fnmatch.h>

namespace fs = std::filesystem;

namespace devtask::clean {

namespace {

fs::path Normalize(const fs::path& path) {
  return path.lexically_normal();
}

// Resolves `path` against `root` unless it is already absolute.
fs::path UnderRoot(const fs::path& root, const fs::path& path) {
  return path.is_absolute() ? Normalize(path) : Normalize(root / path);
}

std::vector<fs::path> AnchorExcludedRoots(const fs::path& root,
                                          const std::vector<fs::path>& excluded_roots) {
  std::vector<fs::path> anchored;
  anchored.reserve(excluded_roots.size());
  for (const auto& excluded : excluded_roots) {
    anchored.push_back(UnderRoot(root, excluded));
  }
  return anchored;
}

bool RemoveTree(const fs::path& path, std::string& error) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    error = "failed to remove '" + path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace

CleanPlan DefaultCleanPlan() {
  CleanPlan plan;
  plan.fixed_paths = {
      ".ruff_cache", ".pytest_cache", ".pyright", ".mypy_cache", "build", "dist", ".uv-cache",
  };
  plan.directory_patterns = {"__pycache__"};
  plan.excluded_roots = {".venv"};
  return plan;
}

bool IsExcluded(const fs::path& path, const std::vector<fs::path>& excluded_roots) {
  const fs::path candidate = Normalize(path);
  for (const auto& excluded : excluded_roots) {
    const fs::path root = Normalize(excluded);
    // Component-wise prefix test so `.venv2` is not treated as inside `.venv`.
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end() && candidate_it != candidate.end(); ++root_it, ++candidate_it) {
      if (*root_it != *candidate_it) {
        break;
      }
    }
    // A trailing separator normalizes to an empty final component.
    if (root_it != root.end() && root_it->empty() && std::next(root_it) == root.end()) {
      ++root_it;
    }
    if (root_it == root.end()) {
      return true;
    }
  }
  return false;
}

bool RemoveMatchingDirectories(const fs::path& root, const std::string& pattern,
                               const std::vector<fs::path>& excluded_roots,
                               std::vector<fs::path>& removed, std::string& error) {
  error.clear();
  const std::vector<fs::path> anchored = AnchorExcludedRoots(root, excluded_roots);

  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    error = "failed to scan '" + root.string() + "': " + ec.message();
    return false;
  }

  // Collect first, delete afterwards: removing while iterating invalidates the
  // iterator's open directory handles. A scan error ends the walk but what was
  // already collected is still removed; the error is reported at the end.
  std::vector<fs::path> matches;
  std::string scan_error;
  for (; it != fs::end(it); it.increment(ec)) {
    if (ec) {
      break;
    }

    const fs::directory_entry& entry = *it;
    std::error_code type_ec;
    if (entry.is_symlink(type_ec) || !entry.is_directory(type_ec)) {
      continue;
    }

    const fs::path path = Normalize(entry.path());
    if (IsExcluded(path, anchored)) {
      it.disable_recursion_pending();
      continue;
    }

    const std::string name = path.filename().string();
    if (fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
      matches.push_back(path);
      it.disable_recursion_pending();
    }
  }
  if (ec) {
    scan_error = "failed to scan '" + root.string() + "': " + ec.message();
  }

  std::sort(matches.begin(), matches.end());
  std::string remove_error;
  for (const auto& match : matches) {
    std::string one_error;
    if (!RemoveTree(match, one_error)) {
      if (remove_error.empty()) {
        remove_error = one_error;
      }
      continue;
    }
    removed.push_back(match);
  }

  error = !scan_error.empty() ? scan_error : remove_error;
  return error.empty();
}

bool ExecuteCleanPlan(const fs::path& root, const CleanPlan& plan, CleanReport& report,
                      std::string& error) {
  error.clear();
  const std::vector<fs::path> anchored = AnchorExcludedRoots(root, plan.excluded_roots);

  for (const auto& fixed : plan.fixed_paths) {
    const fs::path target = UnderRoot(root, fixed);
    if (IsExcluded(target, anchored)) {
      report.skipped_excluded.push_back(target);
      continue;
    }

    std::error_code ec;
    const fs::file_status status = fs::symlink_status(target, ec);
    if (ec || !fs::exists(status)) {
      continue;
    }
    if (!RemoveTree(target, error)) {
      return false;
    }
    report.removed.push_back(target);
  }

  for (const auto& pattern : plan.directory_patterns) {
    if (!RemoveMatchingDirectories(root, pattern, plan.excluded_roots, report.removed, error)) {
      return false;
    }
  }
  return true;
}

} // namespace devtask::clean
