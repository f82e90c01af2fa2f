#pragma once

#include "core/logging/logger.hpp"
#include "tasks/task.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace devtask::tasks {

enum class StepStatus {
  kSucceeded,
  kFailed,
  kSpawnFailed,
};

// Explicit outcome of one step so the short-circuit rule lives in the
// dispatcher rather than in shell semantics.
struct StepResult {
  StepStatus status = StepStatus::kSucceeded;
  int exit_code = 0;
  std::string error;
};

const char* ToString(StepStatus status);

// Seam between ordering logic and the act of running a step. The production
// implementation spawns processes; tests substitute a recorder.
class StepExecutor {
public:
  virtual ~StepExecutor() = default;

  // Runs one step to completion. `run_overrides` is the invocation-wide
  // environment layer; step-level overrides in `step.env` take precedence.
  virtual StepResult Execute(const Step& step, const EnvironmentOverrides& run_overrides) = 0;
};

enum class RunState {
  kPending,
  kRunning,
  kFailed,
  kSucceeded,
};

const char* ToString(RunState state);

// Terminal summary of one invocation. On failure `failed_task`,
// `failed_step_index` and `failed_step` identify the step that stopped it and
// `exit_code` is what the process should exit with.
struct RunReport {
  RunState state = RunState::kPending;
  int exit_code = 0;
  std::size_t steps_completed = 0;
  std::size_t tasks_completed = 0;
  bool spawn_failed = false;
  std::string failed_task;
  std::size_t failed_step_index = 0;
  std::string failed_step;
  std::string error;

  bool Succeeded() const {
    return state == RunState::kSucceeded;
  }
};

// Sequential step runner.
//
// Steps run strictly in declared order, one at a time. The first step that does
// not succeed ends the invocation: no later step of that task and no later task
// is executed. A non-zero exit code is reported unchanged.
class Dispatcher {
public:
  Dispatcher(StepExecutor& executor, EnvironmentOverrides run_overrides,
             core::logging::Logger* logger = nullptr);

  RunReport Run(const Task& task) const;

  // Runs `tasks` back to back as one invocation.
  RunReport RunAll(const std::vector<const Task*>& tasks) const;

private:
  // Returns false when the invocation must stop; `report` is then terminal.
  bool RunTask(const Task& task, RunReport& report) const;

  StepExecutor* executor_ = nullptr;
  EnvironmentOverrides run_overrides_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace devtask::tasks
