#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "io_monad.hpp"
#include "result_monad.hpp"
#include "workflows/task.hpp"

namespace kubeplane::workflows {

// One-shot completion signal of a task run.
//
// The engine publishes exactly one value per run via complete(). Callers may
// observe() it once, and may register any number of continuations; every
// continuation runs exactly once on the engine's io_context after the final
// task state has been persisted.
class TaskCompletion : public std::enable_shared_from_this<TaskCompletion> {
public:
  using Ptr = std::shared_ptr<TaskCompletion>;
  using RunResult = monad::Result<void, monad::Error>;
  using Continuation =
      std::function<void(const Task &final_task, const RunResult &result)>;

  TaskCompletion(boost::asio::io_context &ioc, std::string task_id);

  const std::string &task_id() const { return task_id_; }

  // Returns false when a value had already been published.
  bool complete(Task final_task, RunResult result);

  // Single consumer. A second call yields WORKFLOW::ALREADY_OBSERVED.
  monad::IO<void> observe();

  void on_complete(Continuation continuation);

  bool done() const;
  std::optional<Task> final_task() const;
  std::optional<RunResult> result() const;

private:
  using ObserveCallback = monad::IO<void>::Callback;

  void schedule(Continuation continuation);
  void deliver(ObserveCallback cb);

  boost::asio::io_context &ioc_;
  std::string task_id_;

  mutable std::mutex mutex_;
  bool observed_{false};
  std::optional<Task> final_task_;
  std::optional<RunResult> result_;
  std::optional<ObserveCallback> observer_;
  std::vector<Continuation> continuations_;
};

} // namespace kubeplane::workflows
