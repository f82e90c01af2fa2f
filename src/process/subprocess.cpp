#include "process/subprocess.hpp"

#include <cerrno>
#include <cstring>

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace devtask::process {

namespace {

std::vector<char*> ToCStringArray(const std::vector<std::string>& values) {
  std::vector<char*> pointers;
  pointers.reserve(values.size() + 1U);
  for (const auto& value : values) {
    pointers.push_back(const_cast<char*>(value.c_str()));
  }
  pointers.push_back(nullptr);
  return pointers;
}

} // namespace

SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               const EnvironmentBlock& env) {
  SubprocessResult result;
  if (argv.empty() || argv.front().empty()) {
    result.error = "cannot spawn an empty command";
    return result;
  }

  std::vector<char*> c_argv = ToCStringArray(argv);
  std::vector<char*> c_env = ToCStringArray(env);

  // glibc's posix_spawnp reports exec failures (ENOENT, EACCES) through its
  // return value, which keeps "could not start" apart from "exited 127".
  pid_t pid = -1;
  const int spawn_rc =
      posix_spawnp(&pid, c_argv.front(), nullptr, nullptr, c_argv.data(), c_env.data());
  if (spawn_rc != 0) {
    result.error = "failed to start '" + argv.front() + "': " + std::strerror(spawn_rc);
    return result;
  }
  result.spawned = true;

  int status = 0;
  pid_t waited = -1;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);

  if (waited < 0) {
    result.error = "failed to wait for '" + argv.front() + "': " + std::strerror(errno);
    result.exit_code = -1;
    return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = status;
  }
  return result;
}

} // namespace devtask::process
