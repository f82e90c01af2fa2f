#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

using devtask::tests::common::Assert;
using devtask::tests::common::AssertEqual;
using devtask::tests::common::TouchFile;

int main() {
  const fs::path root = devtask::tests::common::CreateUniqueTempDir("devtask-clean-task-smoke");
  TouchFile(root / ".pytest_cache" / "v" / "cache" / "lastfailed");
  TouchFile(root / ".mypy_cache" / "3.12" / "meta.json");
  TouchFile(root / ".uv-cache" / "wheels" / "w");
  TouchFile(root / "pkg" / "__pycache__" / "a.pyc");
  TouchFile(root / "pkg" / "deep" / "__pycache__" / "b.pyc");
  TouchFile(root / "pkg" / "a.py");
  TouchFile(root / ".venv" / "lib" / "__pycache__" / "keep.pyc");

  int exit_code = -1;
  {
    devtask::tests::common::ScopedWorkingDirectory cwd(root);
    exit_code = devtask::tests::common::DispatchCaptured({"devtask", "clean"}).exit_code;
  }
  AssertEqual(exit_code, 0, "clean task exit code");

  Assert(!fs::exists(root / ".pytest_cache"), ".pytest_cache should be removed");
  Assert(!fs::exists(root / ".mypy_cache"), ".mypy_cache should be removed");
  Assert(!fs::exists(root / ".uv-cache"), ".uv-cache should be removed");
  Assert(!fs::exists(root / "pkg" / "__pycache__"), "pkg/__pycache__ should be removed");
  Assert(!fs::exists(root / "pkg" / "deep" / "__pycache__"),
         "nested __pycache__ should be removed");
  Assert(fs::exists(root / "pkg" / "a.py"), "sources must survive");
  Assert(fs::exists(root / ".venv" / "lib" / "__pycache__" / "keep.pyc"),
         "virtual environment must be left untouched");

  // Running again on a clean tree is a no-op success.
  {
    devtask::tests::common::ScopedWorkingDirectory cwd(root);
    exit_code = devtask::tests::common::DispatchCaptured({"devtask", "clean"}).exit_code;
  }
  AssertEqual(exit_code, 0, "second clean exit code");

  devtask::tests::common::RemovePathBestEffort(root);
  std::cout << "clean_task_smoke: ok\n";
  return 0;
}
