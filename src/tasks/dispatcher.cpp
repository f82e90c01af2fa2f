#include "tasks/dispatcher.hpp"

#include "core/errors/exit_codes.hpp"

#include <utility>

namespace devtask::tasks {

const char* ToString(StepStatus status) {
  switch (status) {
  case StepStatus::kSucceeded:
    return "succeeded";
  case StepStatus::kFailed:
    return "failed";
  case StepStatus::kSpawnFailed:
    return "spawn_failed";
  }

  return "failed";
}

const char* ToString(RunState state) {
  switch (state) {
  case RunState::kPending:
    return "pending";
  case RunState::kRunning:
    return "running";
  case RunState::kFailed:
    return "failed";
  case RunState::kSucceeded:
    return "succeeded";
  }

  return "pending";
}

Dispatcher::Dispatcher(StepExecutor& executor, EnvironmentOverrides run_overrides,
                       core::logging::Logger* logger)
    : executor_(&executor), run_overrides_(std::move(run_overrides)), logger_(logger) {}

RunReport Dispatcher::Run(const Task& task) const {
  return RunAll({&task});
}

RunReport Dispatcher::RunAll(const std::vector<const Task*>& tasks) const {
  RunReport report;
  report.state = RunState::kRunning;

  for (const Task* task : tasks) {
    if (task == nullptr) {
      continue;
    }
    if (!RunTask(*task, report)) {
      if (logger_ != nullptr) {
        logger_->ClearTask();
      }
      return report;
    }
    ++report.tasks_completed;
  }

  if (logger_ != nullptr) {
    logger_->ClearTask();
  }
  report.state = RunState::kSucceeded;
  report.exit_code = core::errors::ToInt(core::errors::ExitCode::kSuccess);
  return report;
}

bool Dispatcher::RunTask(const Task& task, RunReport& report) const {
  if (logger_ != nullptr) {
    logger_->SetTask(task.name);
    logger_->Info("task started", {{"steps", std::to_string(task.steps.size())}});
  }

  for (std::size_t index = 0; index < task.steps.size(); ++index) {
    const Step& step = task.steps[index];
    const std::string description = Describe(step);
    if (logger_ != nullptr) {
      logger_->Debug("step started", {{"index", std::to_string(index)},
                                      {"kind", ToString(step.kind)},
                                      {"command", description}});
    }

    const StepResult result = executor_->Execute(step, run_overrides_);
    if (result.status == StepStatus::kSucceeded) {
      ++report.steps_completed;
      if (logger_ != nullptr) {
        logger_->Debug("step succeeded", {{"index", std::to_string(index)}});
      }
      continue;
    }

    report.state = RunState::kFailed;
    report.failed_task = task.name;
    report.failed_step_index = index;
    report.failed_step = description;
    report.error = result.error;
    if (result.status == StepStatus::kSpawnFailed) {
      report.spawn_failed = true;
      report.exit_code = core::errors::ToInt(core::errors::ExitCode::kSpawnFailed);
    } else {
      // A step that reports failure with exit code 0 must still fail the run.
      report.exit_code = result.exit_code != 0
                             ? result.exit_code
                             : core::errors::ToInt(core::errors::ExitCode::kFailure);
    }

    if (logger_ != nullptr) {
      logger_->Error("step failed", {{"index", std::to_string(index)},
                                     {"command", description},
                                     {"status", ToString(result.status)},
                                     {"exit_code", std::to_string(report.exit_code)},
                                     {"error", result.error}});
    }
    return false;
  }

  if (logger_ != nullptr) {
    logger_->Info("task finished");
  }
  return true;
}

} // namespace devtask::tasks
