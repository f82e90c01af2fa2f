#ifndef DEVTASK_TESTS_COMMON_TEMP_DIR_HPP_
#define DEVTASK_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace devtask::tests::common {

inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static std::atomic<std::uint64_t> counter{0};
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(now_ms) + "-" +
       std::to_string(counter.fetch_add(1U)));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Switches the process working directory for the lifetime of the object.
class ScopedWorkingDirectory {
public:
  explicit ScopedWorkingDirectory(const std::filesystem::path& target)
      : previous_(std::filesystem::current_path()) {
    std::filesystem::current_path(target);
  }

  ~ScopedWorkingDirectory() {
    std::error_code ec;
    std::filesystem::current_path(previous_, ec);
  }

  ScopedWorkingDirectory(const ScopedWorkingDirectory&) = delete;
  ScopedWorkingDirectory& operator=(const ScopedWorkingDirectory&) = delete;

private:
  std::filesystem::path previous_;
};

} // namespace devtask::tests::common

#endif // DEVTASK_TESTS_COMMON_TEMP_DIR_HPP_
