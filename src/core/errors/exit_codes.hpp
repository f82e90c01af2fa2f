#pragma once

namespace devtask::core::errors {

// Stable process-exit contract for devtask's own failures.
//
// A failing tool's exit code is propagated verbatim and never mapped through
// this enum. The values below only cover failures that happen before or
// around a spawn:
// - 0 success
// - 1 generic failure inside a builtin step
// - 2 usage error or unknown task name
// - 3 broken task table (duplicate task, missing default task)
// - 127 step executable could not be started (shell convention)
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kTaskTableInvalid = 3,
  kSpawnFailed = 127,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace devtask::core::errors
