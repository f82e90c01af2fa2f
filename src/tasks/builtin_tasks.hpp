#pragma once

#include "tasks/task_registry.hpp"

#include <string>
#include <string_view>

namespace devtask::tasks {

// Builtin step actions referenced by the task table.
inline constexpr std::string_view kHelpAction = "help";
inline constexpr std::string_view kCleanAction = "clean";

// Fills `registry` with the project task table:
//   help (default), prepare, format, check, test, clean
// Fails only when the table itself is inconsistent.
bool RegisterBuiltinTasks(TaskRegistry& registry, RegistryError& code, std::string& error);

} // namespace devtask::tasks
