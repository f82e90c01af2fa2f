#pragma once

#include "core/logging/logger.hpp"
#include "tasks/dispatcher.hpp"
#include "tasks/task_registry.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace devtask::cli {

// Parsed command line. Task names run in the order given; an empty list
// selects the default task.
struct CliOptions {
  std::vector<std::string> task_names;
  bool dry_run = false;
  bool show_usage = false;
  bool show_version = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options may be mixed with task names; `--` ends option parsing. Unknown
// flags are usage errors.
bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     std::string& error);

// Writes the aligned task listing:
//   Available tasks:
//     <name padded to 20> <description>
void RenderHelp(const tasks::TaskRegistry& registry, std::ostream& out);

// Resolves every requested task before anything runs, so one unknown name
// leaves the tree untouched, then dispatches them through `executor`.
// Returns the process exit code: 0, the failing tool's own code, or one of
// core::errors::ExitCode.
int ExecuteInvocation(const CliOptions& options, const tasks::TaskRegistry& registry,
                      tasks::StepExecutor& executor,
                      const tasks::EnvironmentOverrides& run_overrides, std::ostream& out,
                      core::logging::Logger& logger);

// Process entrypoint contract:
//   0   => every step succeeded
//   N   => a step exited with N (propagated verbatim)
//   2   => usage error / unknown task
//   3   => broken task table
//   127 => a step could not be started
int Dispatch(int argc, char** argv);

} // namespace devtask::cli
