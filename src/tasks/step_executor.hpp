#pragma once

#include "process/environment.hpp"
#include "tasks/dispatcher.hpp"

#include <functional>
#include <map>
#include <string>

namespace devtask::tasks {

// In-process action behind a builtin step. Returns a process-style exit code
// and fills `error` when it is non-zero.
using BuiltinAction = std::function<int(std::string& error)>;

// Production executor: command steps become child processes, builtin steps
// call the registered action.
class ProcessStepExecutor final : public StepExecutor {
public:
  explicit ProcessStepExecutor(process::EnvironmentBlock base_environment);

  // Later registrations under the same name replace earlier ones.
  void RegisterBuiltin(std::string name, BuiltinAction action);

  StepResult Execute(const Step& step, const EnvironmentOverrides& run_overrides) override;

  // Exact environment a command step would be spawned with.
  process::EnvironmentBlock EnvironmentFor(const Step& step,
                                           const EnvironmentOverrides& run_overrides) const;

private:
  StepResult ExecuteBuiltin(const Step& step);
  StepResult ExecuteCommand(const Step& step, const EnvironmentOverrides& run_overrides) const;

  process::EnvironmentBlock base_environment_;
  std::map<std::string, BuiltinAction> builtins_;
};

} // namespace devtask::tasks
