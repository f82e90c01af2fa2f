#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace devtask::tasks {

// Variable name -> value layered on top of an inherited environment.
using EnvironmentOverrides = std::map<std::string, std::string>;

enum class StepKind {
  kCommand,
  kBuiltin,
};

// One unit of work inside a task.
//
// Command steps name an external program resolved through PATH. Builtin steps
// name an in-process action (`help`, `clean`) and ignore `args`/`env`; they
// obey the same ordering and short-circuit rules as commands.
struct Step {
  StepKind kind = StepKind::kCommand;
  std::string program;
  std::vector<std::string> args;
  EnvironmentOverrides env;

  static Step Command(std::string program, std::vector<std::string> args,
                      EnvironmentOverrides env = {});
  static Step Builtin(std::string action);

  // argv form: program followed by args.
  std::vector<std::string> Argv() const;
};

// Human-readable one-liner used by logs and --dry-run, e.g. `uv run ruff check`
// or `<builtin:clean>`.
std::string Describe(const Step& step);

const char* ToString(StepKind kind);

struct Task {
  std::string name;
  std::string description;
  std::vector<Step> steps;
  bool is_default = false;
};

} // namespace devtask::tasks
