#include "workflows/task_repository.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace kubeplane::workflows {

TaskRepository::TaskRepository(storage::IKeyValueStore &store,
                               customio::ConsoleOutput &output)
    : store_(store), output_(output) {}

monad::MyVoidResult TaskRepository::save(const Task &task) {
  if (task.id.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "task id is empty"));
  }
  return store_.put(kPrefix, task.id, encode_task(task));
}

monad::MyResult<Task> TaskRepository::load(const std::string &id) {
  auto raw = store_.get(kPrefix, id);
  if (raw.is_err()) {
    return monad::MyResult<Task>::Err(std::move(raw).error());
  }
  return decode_task(raw.value());
}

monad::MyVoidResult TaskRepository::remove(const std::string &id) {
  return store_.remove(kPrefix, id);
}

monad::MyResult<std::vector<Task>> TaskRepository::list_all() {
  using ReturnType = monad::MyResult<std::vector<Task>>;
  auto entries = store_.list_all(kPrefix);
  if (entries.is_err()) {
    return ReturnType::Err(std::move(entries).error());
  }
  std::vector<Task> tasks;
  tasks.reserve(entries.value().size());
  for (const auto &[id, raw] : entries.value()) {
    auto task = decode_task(raw);
    if (task.is_err()) {
      auto err = std::move(task).error();
      err.what = fmt::format("task {}: {}", id, err.what);
      return ReturnType::Err(std::move(err));
    }
    tasks.push_back(std::move(task).value());
  }
  return ReturnType::Ok(std::move(tasks));
}

monad::MyResult<std::vector<Task>>
TaskRepository::list_by_cluster(const std::string &cluster_name) {
  using ReturnType = monad::MyResult<std::vector<Task>>;
  auto all = list_all();
  if (all.is_err()) {
    return all;
  }
  std::vector<Task> matched;
  for (auto &task : all.value()) {
    if (task.config.cluster_name == cluster_name) {
      matched.push_back(std::move(task));
    }
  }
  return ReturnType::Ok(std::move(matched));
}

monad::MyResult<std::size_t>
TaskRepository::delete_by_cluster(const std::string &cluster_name) {
  auto tasks = list_by_cluster(cluster_name);
  if (tasks.is_err()) {
    return monad::MyResult<std::size_t>::Err(std::move(tasks).error());
  }
  std::size_t removed = 0;
  for (const auto &task : tasks.value()) {
    auto r = store_.remove(kPrefix, task.id);
    if (r.is_err()) {
      output_.logger().warning()
          << "Failed to delete task " << task.id << " of cluster "
          << cluster_name << ": " << r.error().what << std::endl;
      continue;
    }
    ++removed;
  }
  return monad::MyResult<std::size_t>::Ok(removed);
}

} // namespace kubeplane::workflows
