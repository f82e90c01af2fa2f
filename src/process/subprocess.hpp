#pragma once

#include "process/environment.hpp"

#include <string>
#include <vector>

namespace devtask::process {

// Outcome of one child process.
//
// `spawned == false` means the program never started (missing executable,
// permission denied, fork failure) and `error` carries the OS reason. Otherwise
// `exit_code` is the child's status: its exit value, or 128 + signal number
// when it was killed by a signal.
struct SubprocessResult {
  bool spawned = false;
  int exit_code = -1;
  std::string error;
};

// Starts `argv[0]` (PATH lookup) with `argv` and the explicit environment
// `env`, then blocks until the child terminates.
//
// stdin/stdout/stderr and the working directory are inherited from the caller
// so tool output reaches the terminal unbuffered. The child stays in the
// caller's process group, so a terminal interrupt reaches it too.
SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               const EnvironmentBlock& env);

} // namespace devtask::process
