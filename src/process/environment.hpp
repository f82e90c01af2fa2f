#pragma once

#include "tasks/task.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devtask::process {

// `KEY=VALUE` entries in the layout execve() expects.
using EnvironmentBlock = std::vector<std::string>;

// Cache location redirected into the working tree so sandboxed hosts without
// access to user-level cache directories still work.
inline constexpr std::string_view kUvCacheDirVar = "UV_CACHE_DIR";
inline constexpr std::string_view kUvCacheDirName = ".uv-cache";

// Snapshot of the current process environment.
EnvironmentBlock CaptureProcessEnvironment();

// Value of `key` in `block`, or nullopt when the key is absent. A present but
// empty value is returned as an empty string.
std::optional<std::string> LookupVariable(const EnvironmentBlock& block, std::string_view key);

// Run-wide overrides applied to every step of every task in one invocation.
// UV_CACHE_DIR is pointed at `<working_dir>/.uv-cache` unless `base` already
// defines it.
tasks::EnvironmentOverrides BuildRunOverrides(const EnvironmentBlock& base,
                                              const std::filesystem::path& working_dir);

// Layers `run_overrides` then `step_overrides` on top of `base`. Existing keys
// keep their position in `base`; new keys are appended in key order.
EnvironmentBlock MergeEnvironment(const EnvironmentBlock& base,
                                  const tasks::EnvironmentOverrides& run_overrides,
                                  const tasks::EnvironmentOverrides& step_overrides);

} // namespace devtask::process
