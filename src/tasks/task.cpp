#include "tasks/task.hpp"

#include <utility>

namespace devtask::tasks {

Step Step::Command(std::string program, std::vector<std::string> args,
                   EnvironmentOverrides env) {
  Step step;
  step.kind = StepKind::kCommand;
  step.program = std::move(program);
  step.args = std::move(args);
  step.env = std::move(env);
  return step;
}

Step Step::Builtin(std::string action) {
  Step step;
  step.kind = StepKind::kBuiltin;
  step.program = std::move(action);
  return step;
}

std::vector<std::string> Step::Argv() const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1U);
  argv.push_back(program);
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

std::string Describe(const Step& step) {
  if (step.kind == StepKind::kBuiltin) {
    return "<builtin:" + step.program + ">";
  }

  std::string text;
  for (const auto& [key, value] : step.env) {
    text += key + "=" + value + " ";
  }
  text += step.program;
  for (const auto& arg : step.args) {
    text.push_back(' ');
    // Quote only what a reader would otherwise misparse.
    if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
      text += "'" + arg + "'";
    } else {
      text += arg;
    }
  }
  return text;
}

const char* ToString(StepKind kind) {
  switch (kind) {
  case StepKind::kCommand:
    return "command";
  case StepKind::kBuiltin:
    return "builtin";
  }

  return "command";
}

} // namespace devtask::tasks
