#include "tasks/task_registry.hpp"

#include <utility>

namespace devtask::tasks {

const char* ToString(RegistryError error) {
  switch (error) {
  case RegistryError::kNone:
    return "none";
  case RegistryError::kInvalidTask:
    return "invalid_task";
  case RegistryError::kDuplicateTask:
    return "duplicate_task";
  case RegistryError::kMultipleDefaultTasks:
    return "multiple_default_tasks";
  case RegistryError::kUnknownTask:
    return "unknown_task";
  case RegistryError::kNoDefaultTask:
    return "no_default_task";
  }

  return "none";
}

bool TaskRegistry::Register(Task task, RegistryError& code, std::string& error) {
  code = RegistryError::kNone;
  error.clear();

  if (task.name.empty()) {
    code = RegistryError::kInvalidTask;
    error = "task name cannot be empty";
    return false;
  }

  if (index_by_name_.find(task.name) != index_by_name_.end()) {
    code = RegistryError::kDuplicateTask;
    error = "duplicate task: " + task.name;
    return false;
  }

  if (task.is_default && default_index_.has_value()) {
    code = RegistryError::kMultipleDefaultTasks;
    error = "task '" + task.name + "' cannot be the default: '" +
            tasks_[*default_index_].name + "' already is";
    return false;
  }

  const std::size_t index = tasks_.size();
  const bool is_default = task.is_default;
  tasks_.push_back(std::move(task));
  try {
    index_by_name_.emplace(tasks_.back().name, index);
  } catch (...) {
    tasks_.pop_back();
    throw;
  }
  if (is_default) {
    default_index_ = index;
  }
  return true;
}

const Task* TaskRegistry::Resolve(std::optional<std::string_view> name, RegistryError& code,
                                  std::string& error) const {
  code = RegistryError::kNone;
  error.clear();

  if (!name.has_value()) {
    if (!default_index_.has_value()) {
      code = RegistryError::kNoDefaultTask;
      error = "no task given and no default task is registered";
      return nullptr;
    }
    return &tasks_[*default_index_];
  }

  const auto it = index_by_name_.find(std::string(*name));
  if (it == index_by_name_.end()) {
    code = RegistryError::kUnknownTask;
    error = "unknown task: " + std::string(*name);
    return nullptr;
  }
  return &tasks_[it->second];
}

} // namespace devtask::tasks
