#include "tasks/builtin_tasks.hpp"

#include <utility>
#include <vector>

namespace devtask::tasks {

namespace {

// Every Python tool runs through `uv run` so it uses the locked environment.
Step Uv(std::vector<std::string> args) {
  return Step::Command("uv", std::move(args));
}

std::vector<Task> BuildTaskTable() {
  std::vector<Task> table;

  table.push_back(Task{
      .name = "help",
      .description = "Show available tasks.",
      .steps = {Step::Builtin(std::string(kHelpAction))},
      .is_default = true,
  });
  table.push_back(Task{
      .name = "prepare",
      .description = "Sync dependencies using locked versions.",
      .steps = {Uv({"sync", "--frozen"})},
  });
  table.push_back(Task{
      .name = "format",
      .description = "Auto-format Python sources with ruff.",
      .steps =
          {
              Uv({"run", "ruff", "check", "--fix"}),
              Uv({"run", "ruff", "format"}),
          },
  });
  table.push_back(Task{
      .name = "check",
      .description = "Run linting and type checks.",
      .steps =
          {
              Uv({"run", "ruff", "check"}),
              Uv({"run", "ruff", "format", "--check"}),
              Uv({"run", "pyright"}),
          },
  });
  table.push_back(Task{
      .name = "test",
      .description = "Run the test suite with pytest.",
      .steps = {Uv({"run", "pytest", "-vv"})},
  });
  table.push_back(Task{
      .name = "clean",
      .description = "Remove local cache and build artifacts.",
      .steps = {Step::Builtin(std::string(kCleanAction))},
  });

  return table;
}

} // namespace

bool RegisterBuiltinTasks(TaskRegistry& registry, RegistryError& code, std::string& error) {
  for (Task& task : BuildTaskTable()) {
    if (!registry.Register(std::move(task), code, error)) {
      return false;
    }
  }
  return true;
}

} // namespace devtask::tasks
