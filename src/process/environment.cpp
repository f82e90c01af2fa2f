#include "process/environment.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <set>

extern char** environ;

namespace devtask::process {

namespace {

std::string_view KeyOf(std::string_view entry) {
  const std::size_t eq = entry.find('=');
  return eq == std::string_view::npos ? entry : entry.substr(0, eq);
}

} // namespace

EnvironmentBlock CaptureProcessEnvironment() {
  EnvironmentBlock block;
  if (environ == nullptr) {
    return block;
  }
  for (char** entry = environ; *entry != nullptr; ++entry) {
    block.emplace_back(*entry);
  }
  return block;
}

std::optional<std::string> LookupVariable(const EnvironmentBlock& block, std::string_view key) {
  for (const auto& entry : block) {
    if (KeyOf(entry) != key) {
      continue;
    }
    if (entry.size() == key.size()) {
      return std::string();
    }
    return entry.substr(key.size() + 1U);
  }
  return std::nullopt;
}

tasks::EnvironmentOverrides BuildRunOverrides(const EnvironmentBlock& base,
                                              const std::filesystem::path& working_dir) {
  tasks::EnvironmentOverrides overrides;
  if (!LookupVariable(base, kUvCacheDirVar).has_value()) {
    overrides.emplace(std::string(kUvCacheDirVar),
                      (working_dir / std::string(kUvCacheDirName)).string());
  }
  return overrides;
}

EnvironmentBlock MergeEnvironment(const EnvironmentBlock& base,
                                  const tasks::EnvironmentOverrides& run_overrides,
                                  const tasks::EnvironmentOverrides& step_overrides) {
  // Step values win over run values.
  std::map<std::string, std::string, std::less<>> layered(run_overrides.begin(),
                                                          run_overrides.end());
  for (const auto& [key, value] : step_overrides) {
    layered[key] = value;
  }

  EnvironmentBlock merged;
  merged.reserve(base.size() + layered.size());
  std::set<std::string, std::less<>> emitted;
  for (const auto& entry : base) {
    const std::string_view key = KeyOf(entry);
    const auto it = layered.find(key);
    if (it == layered.end()) {
      merged.push_back(entry);
      continue;
    }
    // A key listed twice in `base` collapses to one overridden entry.
    if (emitted.insert(it->first).second) {
      merged.push_back(it->first + "=" + it->second);
    }
  }

  for (const auto& [key, value] : layered) {
    if (emitted.find(key) == emitted.end()) {
      merged.push_back(key + "=" + value);
    }
  }
  return merged;
}

} // namespace devtask::process
