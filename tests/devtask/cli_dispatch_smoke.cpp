#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/recording_executor.hpp"
#include "devtask/cli/router.hpp"
#include "tasks/builtin_tasks.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using devtask::tests::common::Assert;
using devtask::tests::common::AssertContains;
using devtask::tests::common::AssertEqual;
using devtask::tests::common::AssertNotContains;
using devtask::tests::common::DispatchCaptured;

namespace {

devtask::tasks::TaskRegistry BuildRegistry() {
  devtask::tasks::TaskRegistry registry;
  devtask::tasks::RegistryError code = devtask::tasks::RegistryError::kNone;
  std::string error;
  if (!devtask::tasks::RegisterBuiltinTasks(registry, code, error)) {
    devtask::tests::common::Fail("task table rejected: " + error);
  }
  return registry;
}

void CheckEntrypoint() {
  // No task name runs the default task, which renders the listing.
  const auto listing = DispatchCaptured({"devtask"});
  AssertEqual(listing.exit_code, 0, "default task exit code");
  AssertContains(listing.out, "Available tasks:");
  AssertContains(listing.out, "prepare");
  AssertContains(listing.out, "Run linting and type checks.");

  const auto help = DispatchCaptured({"devtask", "help"});
  AssertEqual(help.exit_code, 0, "help task exit code");
  Assert(help.out == listing.out, "help listing should be stable across calls");

  const auto unknown = DispatchCaptured({"devtask", "lint"});
  AssertEqual(unknown.exit_code, 2, "unknown task exit code");
  AssertContains(unknown.err, "unknown task: lint");
  AssertNotContains(unknown.out, "Available tasks:");

  const auto bad_flag = DispatchCaptured({"devtask", "--frobnicate"});
  AssertEqual(bad_flag.exit_code, 2, "unknown option exit code");
  AssertContains(bad_flag.err, "unknown option: --frobnicate");

  const auto bad_level = DispatchCaptured({"devtask", "--log-level", "loud", "help"});
  AssertEqual(bad_level.exit_code, 2, "invalid log level exit code");

  const auto version = DispatchCaptured({"devtask", "--version"});
  AssertEqual(version.exit_code, 0, "version exit code");
  AssertContains(version.out, "devtask ");

  const auto usage = DispatchCaptured({"devtask", "-h"});
  AssertEqual(usage.exit_code, 0, "usage exit code");
  AssertContains(usage.out, "usage:");

  // Dry run prints the plan and the environment override without executing.
  const auto dry = DispatchCaptured({"devtask", "--dry-run", "format", "check"});
  AssertEqual(dry.exit_code, 0, "dry run exit code");
  AssertContains(dry.out, "format:\n  uv run ruff check --fix\n  uv run ruff format\n");
  AssertContains(dry.out, "check:\n  uv run ruff check\n");
  AssertContains(dry.out, "  uv run pyright\n");
  Assert(dry.out.find("format:") < dry.out.find("check:"), "dry run keeps task order");
}

void CheckInvocationOrdering() {
  const devtask::tasks::TaskRegistry registry = BuildRegistry();
  devtask::core::logging::Logger logger(devtask::core::logging::LogLevel::kError,
                                        std::cerr);
  const devtask::tasks::EnvironmentOverrides overrides = {{"UV_CACHE_DIR", "/w/.uv-cache"}};

  // Multiple tasks run in the order given; every step gets the same overrides.
  {
    devtask::tests::common::RecordingExecutor executor;
    devtask::cli::CliOptions options;
    options.task_names = {"prepare", "test"};
    std::ostringstream out;
    const int exit_code =
        devtask::cli::ExecuteInvocation(options, registry, executor, overrides, out, logger);
    AssertEqual(exit_code, 0, "prepare+test exit code");
    AssertEqual(static_cast<int>(executor.Calls().size()), 2, "prepare+test step count");
    Assert(executor.Calls()[0].args == std::vector<std::string>{"sync", "--frozen"},
           "prepare runs first");
    Assert(executor.Calls()[1].args == std::vector<std::string>{"run", "pytest", "-vv"},
           "test runs second");
    for (const auto& call : executor.Calls()) {
      Assert(call.run_overrides == overrides, "every step sees the run overrides");
    }
  }

  // An unknown name anywhere in the list means nothing runs.
  {
    devtask::tests::common::RecordingExecutor executor;
    devtask::cli::CliOptions options;
    options.task_names = {"prepare", "nope", "test"};
    std::ostringstream out;
    std::ostringstream captured_err;
    std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
    const int exit_code =
        devtask::cli::ExecuteInvocation(options, registry, executor, overrides, out, logger);
    std::cerr.rdbuf(original_err);
    AssertEqual(exit_code, 2, "unknown task in list exit code");
    Assert(executor.Calls().empty(), "no task may run when one name is unknown");
  }

  // A failing tool's exit code becomes the invocation's exit code.
  {
    devtask::tests::common::RecordingExecutor executor;
    executor.SetExitCode("uv", 9);
    devtask::cli::CliOptions options;
    options.task_names = {"check", "test"};
    std::ostringstream out;
    std::ostringstream captured_err;
    std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
    const int exit_code =
        devtask::cli::ExecuteInvocation(options, registry, executor, overrides, out, logger);
    std::cerr.rdbuf(original_err);
    AssertEqual(exit_code, 9, "propagated tool exit code");
    AssertEqual(static_cast<int>(executor.Calls().size()), 1, "check stops at first step");
    AssertContains(captured_err.str(), "task 'check' failed at `uv run ruff check` (exit code 9)");
  }

  // A registry without a default task cannot serve an empty invocation.
  {
    devtask::tasks::TaskRegistry no_default;
    devtask::tasks::RegistryError code = devtask::tasks::RegistryError::kNone;
    std::string error;
    devtask::tasks::Task task;
    task.name = "only";
    Assert(no_default.Register(task, code, error), "register only task");

    devtask::tests::common::RecordingExecutor executor;
    devtask::cli::CliOptions options;
    std::ostringstream out;
    std::ostringstream captured_err;
    std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
    const int exit_code =
        devtask::cli::ExecuteInvocation(options, no_default, executor, overrides, out, logger);
    std::cerr.rdbuf(original_err);
    AssertEqual(exit_code, 3, "no default task exit code");
    AssertContains(captured_err.str(), "no default task");
  }
}

void CheckOptionParsing() {
  devtask::cli::CliOptions options;
  std::string error;
  const std::vector<std::string_view> args = {"format", "--log-level=debug", "-n", "--",
                                              "--weird-task"};
  Assert(devtask::cli::ParseCliOptions(args, options, error), "options should parse");
  Assert(options.dry_run, "-n enables dry run");
  Assert(options.log_level == devtask::core::logging::LogLevel::kDebug, "log level parsed");
  Assert(options.task_names == std::vector<std::string>{"format", "--weird-task"},
         "tasks keep order and `--` ends options");

  devtask::cli::CliOptions missing_value;
  Assert(!devtask::cli::ParseCliOptions({"--log-level"}, missing_value, error),
         "--log-level without value is a usage error");
  AssertContains(error, "missing value for --log-level");
}

} // namespace

int main() {
  CheckEntrypoint();
  CheckInvocationOrdering();
  CheckOptionParsing();
  std::cout << "cli_dispatch_smoke: ok\n";
  return 0;
}
