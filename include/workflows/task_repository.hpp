#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "result_monad.hpp"
#include "storage/key_value_store.hpp"
#include "workflows/task.hpp"

namespace kubeplane::workflows {

// Tasks persisted as JSON under "/tasks/<id>".
class TaskRepository {
public:
  static constexpr const char *kPrefix = "/tasks/";

  TaskRepository(storage::IKeyValueStore &store,
                 customio::ConsoleOutput &output);

  monad::MyVoidResult save(const Task &task);
  monad::MyResult<Task> load(const std::string &id);
  monad::MyVoidResult remove(const std::string &id);

  // A record that fails to decode fails the whole listing.
  monad::MyResult<std::vector<Task>> list_all();

  // Full scan filtered on config.cluster_name.
  monad::MyResult<std::vector<Task>>
  list_by_cluster(const std::string &cluster_name);

  // Removes every task of the cluster. Individual delete failures are logged
  // and skipped; the count of removed tasks is returned.
  monad::MyResult<std::size_t>
  delete_by_cluster(const std::string &cluster_name);

private:
  storage::IKeyValueStore &store_;
  customio::ConsoleOutput &output_;
};

} // namespace kubeplane::workflows
