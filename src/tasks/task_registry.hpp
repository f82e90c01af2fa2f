#pragma once

#include "tasks/task.hpp"

#include <cstddef>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace devtask::tasks {

enum class RegistryError {
  kNone,
  kInvalidTask,
  kDuplicateTask,
  kMultipleDefaultTasks,
  kUnknownTask,
  kNoDefaultTask,
};

const char* ToString(RegistryError error);

struct HelpEntry {
  std::string_view name;
  std::string_view description;
};

// Name -> task table built once at startup.
//
// Lookup goes through a hash index; listing walks the backing vector so help
// output follows registration order. Pointers returned by Resolve stay valid
// until the next successful Register, which in practice never happens after
// startup.
class TaskRegistry {
public:
  // Adds `task`. On failure the registry is left untouched and `code`/`error`
  // describe why: empty name, name already taken, or a second default task.
  bool Register(Task task, RegistryError& code, std::string& error);

  // nullopt selects the default task.
  const Task* Resolve(std::optional<std::string_view> name, RegistryError& code,
                      std::string& error) const;

  // Lazily projected (name, description) pairs in registration order. The
  // view borrows from the registry.
  auto HelpListing() const {
    return tasks_ | std::views::transform([](const Task& task) {
             return HelpEntry{task.name, task.description};
           });
  }

  std::size_t Size() const {
    return tasks_.size();
  }

  bool Empty() const {
    return tasks_.empty();
  }

private:
  std::vector<Task> tasks_;
  std::unordered_map<std::string, std::size_t> index_by_name_;
  std::optional<std::size_t> default_index_;
};

} // namespace devtask::tasks
