#include "tasks/step_executor.hpp"

#include "core/errors/exit_codes.hpp"
#include "process/subprocess.hpp"

#include <iostream>
#include <utility>

namespace devtask::tasks {

ProcessStepExecutor::ProcessStepExecutor(process::EnvironmentBlock base_environment)
    : base_environment_(std::move(base_environment)) {}

void ProcessStepExecutor::RegisterBuiltin(std::string name, BuiltinAction action) {
  builtins_[std::move(name)] = std::move(action);
}

StepResult ProcessStepExecutor::Execute(const Step& step,
                                        const EnvironmentOverrides& run_overrides) {
  if (step.kind == StepKind::kBuiltin) {
    return ExecuteBuiltin(step);
  }
  return ExecuteCommand(step, run_overrides);
}

process::EnvironmentBlock ProcessStepExecutor::EnvironmentFor(
    const Step& step, const EnvironmentOverrides& run_overrides) const {
  return process::MergeEnvironment(base_environment_, run_overrides, step.env);
}

StepResult ProcessStepExecutor::ExecuteBuiltin(const Step& step) {
  StepResult result;
  const auto it = builtins_.find(step.program);
  if (it == builtins_.end() || !it->second) {
    result.status = StepStatus::kSpawnFailed;
    result.exit_code = core::errors::ToInt(core::errors::ExitCode::kSpawnFailed);
    result.error = "no builtin action named '" + step.program + "'";
    return result;
  }

  std::string error;
  const int exit_code = it->second(error);
  result.exit_code = exit_code;
  if (exit_code != 0) {
    result.status = StepStatus::kFailed;
    result.error = std::move(error);
  }
  return result;
}

StepResult ProcessStepExecutor::ExecuteCommand(const Step& step,
                                               const EnvironmentOverrides& run_overrides) const {
  StepResult result;
  // The child writes straight to the inherited descriptors; anything still
  // buffered on our side must land first.
  std::cout.flush();
  std::cerr.flush();
  const process::SubprocessResult child =
      process::RunSubprocess(step.Argv(), EnvironmentFor(step, run_overrides));

  if (!child.spawned) {
    result.status = StepStatus::kSpawnFailed;
    result.exit_code = core::errors::ToInt(core::errors::ExitCode::kSpawnFailed);
    result.error = child.error;
    return result;
  }

  // Started but could not be reaped; the tool's real status is unknown.
  if (!child.error.empty()) {
    result.status = StepStatus::kFailed;
    result.exit_code = core::errors::ToInt(core::errors::ExitCode::kFailure);
    result.error = child.error;
    return result;
  }

  result.exit_code = child.exit_code;
  if (child.exit_code != 0) {
    result.status = StepStatus::kFailed;
    result.error = "'" + step.program + "' exited with code " + std::to_string(child.exit_code);
  }
  return result;
}

} // namespace devtask::tasks
