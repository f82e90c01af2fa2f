#include "devtask/cli/router.hpp"

#include "clean/cache_cleaner.hpp"
#include "core/errors/exit_codes.hpp"
#include "process/environment.hpp"
#include "tasks/builtin_tasks.hpp"
#include "tasks/step_executor.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace devtask::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitTaskTableInvalid =
    core::errors::ToInt(core::errors::ExitCode::kTaskTableInvalid);

constexpr std::string_view kVersion = "devtask 0.1.0";
constexpr int kHelpNameWidth = 20;

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  devtask [--dry-run] [--log-level <" << core::logging::ExpectedLogLevelList()
      << ">] [task...]\n"
      << "  devtask --version\n"
      << "  devtask --help\n"
      << "\n"
      << "Without a task name the default task runs. Run `devtask help` to list tasks.\n";
}

int ExitCodeFor(tasks::RegistryError code) {
  switch (code) {
  case tasks::RegistryError::kUnknownTask:
    return kExitUsage;
  case tasks::RegistryError::kNone:
    return kExitSuccess;
  default:
    return kExitTaskTableInvalid;
  }
}

void PrintDryRun(const std::vector<const tasks::Task*>& plan,
                 const tasks::EnvironmentOverrides& run_overrides, std::ostream& out) {
  for (const auto& [key, value] : run_overrides) {
    out << "env " << key << "=" << value << '\n';
  }
  for (const tasks::Task* task : plan) {
    out << task->name << ":\n";
    for (const auto& step : task->steps) {
      out << "  " << tasks::Describe(step) << '\n';
    }
  }
}

int RunCleanAction(core::logging::Logger& logger, std::string& error) {
  std::error_code ec;
  const fs::path root = fs::current_path(ec);
  if (ec) {
    error = "failed to resolve working directory: " + ec.message();
    return kExitFailure;
  }

  clean::CleanReport report;
  if (!clean::ExecuteCleanPlan(root, clean::DefaultCleanPlan(), report, error)) {
    return kExitFailure;
  }

  for (const auto& path : report.removed) {
    logger.Debug("removed", {{"path", path.string()}});
  }
  for (const auto& path : report.skipped_excluded) {
    logger.Debug("skipped excluded path", {{"path", path.string()}});
  }
  logger.Info("clean finished", {{"removed", std::to_string(report.removed.size())}});
  return kExitSuccess;
}

} // namespace

bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     std::string& error) {
  error.clear();
  bool options_ended = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    if (options_ended || token.empty() || token.front() != '-') {
      options.task_names.emplace_back(token);
      continue;
    }

    if (token == "--") {
      options_ended = true;
      continue;
    }
    if (token == "--dry-run" || token == "-n") {
      options.dry_run = true;
      continue;
    }
    if (token == "--help" || token == "-h") {
      options.show_usage = true;
      continue;
    }
    if (token == "--version") {
      options.show_version = true;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level (expected " +
                core::logging::ExpectedLogLevelList() + ")";
        return false;
      }
      if (!core::logging::ParseLogLevel(args[++i], options.log_level, error)) {
        return false;
      }
      continue;
    }
    constexpr std::string_view kLogLevelPrefix = "--log-level=";
    if (token.substr(0, kLogLevelPrefix.size()) == kLogLevelPrefix) {
      if (!core::logging::ParseLogLevel(token.substr(kLogLevelPrefix.size()), options.log_level,
                                        error)) {
        return false;
      }
      continue;
    }

    error = "unknown option: " + std::string(token);
    return false;
  }

  return true;
}

void RenderHelp(const tasks::TaskRegistry& registry, std::ostream& out) {
  out << "Available tasks:\n";
  for (const tasks::HelpEntry entry : registry.HelpListing()) {
    out << "  " << std::left << std::setw(kHelpNameWidth) << entry.name << ' '
        << entry.description << '\n';
  }
  out << std::right;
}

int ExecuteInvocation(const CliOptions& options, const tasks::TaskRegistry& registry,
                      tasks::StepExecutor& executor,
                      const tasks::EnvironmentOverrides& run_overrides, std::ostream& out,
                      core::logging::Logger& logger) {
  std::vector<std::optional<std::string_view>> requested;
  if (options.task_names.empty()) {
    requested.emplace_back(std::nullopt);
  }
  for (const auto& name : options.task_names) {
    requested.emplace_back(name);
  }

  std::vector<const tasks::Task*> plan;
  plan.reserve(requested.size());
  for (const auto& name : requested) {
    tasks::RegistryError code = tasks::RegistryError::kNone;
    std::string error;
    const tasks::Task* task = registry.Resolve(name, code, error);
    if (task == nullptr) {
      logger.Error("task resolution failed", {{"reason", tasks::ToString(code)}});
      std::cerr << "error: " << error << '\n';
      if (code == tasks::RegistryError::kUnknownTask) {
        std::cerr << "run `devtask help` to list available tasks\n";
      }
      return ExitCodeFor(code);
    }
    plan.push_back(task);
  }

  if (options.dry_run) {
    PrintDryRun(plan, run_overrides, out);
    return kExitSuccess;
  }

  const tasks::Dispatcher dispatcher(executor, run_overrides, &logger);
  const tasks::RunReport report = dispatcher.RunAll(plan);
  if (report.Succeeded()) {
    return kExitSuccess;
  }

  if (report.spawn_failed) {
    std::cerr << "error: task '" << report.failed_task << "' could not start `"
              << report.failed_step << "`: " << report.error << '\n';
  } else {
    std::cerr << "error: task '" << report.failed_task << "' failed at `" << report.failed_step
              << "` (exit code " << report.exit_code << ")\n";
  }
  return report.exit_code;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  CliOptions options;
  std::string error;
  if (!ParseCliOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  if (options.show_usage) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (options.show_version) {
    std::cout << kVersion << '\n';
    return kExitSuccess;
  }

  core::logging::Logger logger(options.log_level);

  tasks::TaskRegistry registry;
  tasks::RegistryError code = tasks::RegistryError::kNone;
  if (!tasks::RegisterBuiltinTasks(registry, code, error)) {
    logger.Error("task table rejected", {{"reason", tasks::ToString(code)}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitTaskTableInvalid;
  }

  std::error_code ec;
  const fs::path working_dir = fs::current_path(ec);
  if (ec) {
    std::cerr << "error: failed to resolve working directory: " << ec.message() << '\n';
    return kExitFailure;
  }

  // Overrides are computed once, before any task runs, and handed to every step.
  process::EnvironmentBlock base_environment = process::CaptureProcessEnvironment();
  const tasks::EnvironmentOverrides run_overrides =
      process::BuildRunOverrides(base_environment, working_dir);
  for (const auto& [key, value] : run_overrides) {
    logger.Debug("environment override", {{"name", key}, {"value", value}});
  }

  tasks::ProcessStepExecutor executor(std::move(base_environment));
  executor.RegisterBuiltin(std::string(tasks::kHelpAction), [&registry](std::string&) {
    RenderHelp(registry, std::cout);
    std::cout.flush();
    return kExitSuccess;
  });
  executor.RegisterBuiltin(std::string(tasks::kCleanAction), [&logger](std::string& action_error) {
    return RunCleanAction(logger, action_error);
  });

  return ExecuteInvocation(options, registry, executor, run_overrides, std::cout, logger);
}

} // namespace devtask::cli
