#include "workflows/task_engine.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace kubeplane::workflows {

namespace {

monad::Error cancel_error(const RunContext &ctx) {
  auto reason = ctx.reason().value_or("cancelled");
  return monad::make_error(ctx.deadline_exceeded()
                               ? my_errors::WORKFLOW::DEADLINE_EXCEEDED
                               : my_errors::WORKFLOW::CANCELLED,
                           "cancelled: " + reason);
}

// A step error surfaces as WORKFLOW::STEP_FAILED with the step's message,
// unless the run context was cancelled underneath it.
monad::Error step_failure(const RunContext &ctx, monad::Error err) {
  if (err.code == my_errors::WORKFLOW::CANCELLED ||
      err.code == my_errors::WORKFLOW::DEADLINE_EXCEEDED) {
    return err;
  }
  if (ctx.cancelled()) {
    return cancel_error(ctx);
  }
  err.code = my_errors::WORKFLOW::STEP_FAILED;
  return err;
}

} // namespace

struct TaskEngine::Execution {
  Task task;
  std::vector<IStep::Ptr> steps;
  ILogSink::Ptr sink;
  RunContext::Ptr ctx;
  TaskCompletion::Ptr completion;
  std::atomic<RunContext::CallbackHandle> cancel_handle{0};
};

TaskEngine::TaskEngine(cjj365::IoContextManager &io_context_manager,
                       IWorkflowRegistryProvider &registry_provider,
                       TaskRepository &repository,
                       customio::ConsoleOutput &output)
    : io_context_manager_(io_context_manager),
      registry_(registry_provider.registry()), repository_(repository),
      output_(output) {
  if (!registry_) {
    throw std::runtime_error("TaskEngine requires a workflow registry");
  }
}

monad::MyResult<Task> TaskEngine::create(const std::string &kind) {
  auto steps = registry_->resolve_steps(kind);
  if (steps.is_err()) {
    return monad::MyResult<Task>::Err(std::move(steps).error());
  }

  Task task;
  task.id = stringutil::generate_uuid();
  task.type = kind;
  task.status = TaskStatus::Pending;
  for (const auto &step : steps.value()) {
    StepStatus status;
    status.name = step->name();
    status.description = step->description();
    task.steps_statuses.push_back(std::move(status));
  }

  if (auto saved = repository_.save(task); saved.is_err()) {
    return monad::MyResult<Task>::Err(std::move(saved).error());
  }
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "created task " << task.id << " of kind " << kind << " with "
      << task.steps_statuses.size() << " steps";
  return monad::MyResult<Task>::Ok(std::move(task));
}

monad::MyResult<TaskCompletion::Ptr> TaskEngine::run(Task task,
                                                     StepConfig config,
                                                     ILogSink::Ptr sink,
                                                     RunContext::Ptr ctx) {
  using ReturnType = monad::MyResult<TaskCompletion::Ptr>;
  if (task.status != TaskStatus::Pending) {
    return ReturnType::Err(monad::make_error(
        my_errors::WORKFLOW::INVALID_TRANSITION,
        fmt::format("task {} is {}, only pending tasks can run", task.id,
                    to_string(task.status))));
  }
  if (!sink) {
    return ReturnType::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("task {} has no log sink", task.id)));
  }
  auto steps = registry_->resolve_steps(task.type);
  if (steps.is_err()) {
    return ReturnType::Err(std::move(steps).error());
  }
  if (steps.value().size() != task.steps_statuses.size()) {
    return ReturnType::Err(monad::make_error(
        my_errors::WORKFLOW::VALIDATION_FAILED,
        fmt::format("task {} has {} steps but workflow {} has {}", task.id,
                    task.steps_statuses.size(), task.type,
                    steps.value().size())));
  }

  if (!ctx) {
    ctx = RunContext::background();
  }
  if (config.timeout_seconds > 0) {
    ctx = RunContext::with_deadline(ioc(),
                                    std::chrono::seconds(config.timeout_seconds),
                                    ctx);
  }

  task.config = std::move(config);
  if (auto r = task.transition_to(TaskStatus::Running); r.is_err()) {
    return ReturnType::Err(std::move(r).error());
  }
  if (auto saved = repository_.save(task); saved.is_err()) {
    return ReturnType::Err(std::move(saved).error());
  }

  auto exec = std::make_shared<Execution>();
  exec->completion = std::make_shared<TaskCompletion>(ioc(), task.id);
  exec->task = std::move(task);
  exec->steps = std::move(steps).value();
  exec->sink = std::move(sink);
  exec->ctx = std::move(ctx);

  BOOST_LOG_SEV(lg_, trivial::info)
      << "task " << exec->task.id << " (" << exec->task.type << ") started for "
      << "cluster " << exec->task.config.cluster_name;

  auto completion = exec->completion;
  boost::asio::post(ioc(), [self = shared_from_this(), exec]() {
    self->run_step(exec, 0);
  });
  return ReturnType::Ok(std::move(completion));
}

void TaskEngine::run_step(std::shared_ptr<Execution> exec, std::size_t index) {
  const auto total = exec->steps.size();
  if (index >= total) {
    if (auto r = exec->task.transition_to(TaskStatus::Success); r.is_err()) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "task " << exec->task.id << ": " << r.error().what;
    }
    persist(*exec);
    finish(exec, TaskCompletion::RunResult::Ok());
    return;
  }

  if (exec->ctx->cancelled()) {
    fail_from(exec, index, cancel_error(*exec->ctx));
    return;
  }

  if (auto r = exec->task.mark_step_running(index, now_epoch_ms());
      r.is_err()) {
    fail_from(exec, index, std::move(r).error());
    return;
  }
  persist(*exec);

  auto step = exec->steps[index];
  exec->sink->write(fmt::format("[step {}/{}] {}: {}", index + 1, total,
                                step->name(), step->description()));

  // Whichever of step result and cancellation arrives first wins; the other
  // is dropped.
  auto settled = std::make_shared<std::atomic<bool>>(false);
  auto self = shared_from_this();
  auto settle = [self, exec, index, settled](monad::MyVoidResult result) {
    if (settled->exchange(true)) {
      return;
    }
    boost::asio::post(self->ioc(), [self, exec, index,
                                    result = std::move(result)]() mutable {
      self->on_step_result(exec, index, std::move(result));
    });
  };

  std::weak_ptr<RunContext> weak_ctx = exec->ctx;
  exec->cancel_handle =
      exec->ctx->on_cancel([settle, weak_ctx](const std::string &reason) {
        if (auto ctx = weak_ctx.lock()) {
          settle(monad::MyVoidResult::Err(cancel_error(*ctx)));
          return;
        }
        settle(monad::MyVoidResult::Err(monad::make_error(
            my_errors::WORKFLOW::CANCELLED, "cancelled: " + reason)));
      });
  if (settled->load()) {
    return;
  }

  step->run(exec->ctx, exec->task.config, exec->sink)
      .run([settle](monad::MyVoidResult result) { settle(std::move(result)); });
}

void TaskEngine::on_step_result(std::shared_ptr<Execution> exec,
                                std::size_t index,
                                monad::MyVoidResult result) {
  if (auto handle = exec->cancel_handle.exchange(0); handle != 0) {
    exec->ctx->remove_on_cancel(handle);
  }
  if (result.is_err()) {
    fail_from(exec, index, step_failure(*exec->ctx, std::move(result).error()));
    return;
  }
  if (auto r = exec->task.mark_step_succeeded(index, now_epoch_ms());
      r.is_err()) {
    fail_from(exec, index, std::move(r).error());
    return;
  }
  exec->sink->write(fmt::format("[step {}/{}] {} succeeded", index + 1,
                                exec->steps.size(),
                                exec->task.steps_statuses[index].name));
  persist(*exec);
  run_step(exec, index + 1);
}

void TaskEngine::fail_from(std::shared_ptr<Execution> exec, std::size_t index,
                           monad::Error err) {
  auto &task = exec->task;
  if (auto r = task.mark_step_failed(index, err.what, now_epoch_ms());
      r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "task " << task.id << ": " << r.error().what;
  }
  exec->sink->write(fmt::format("[step {}/{}] {} failed: {}", index + 1,
                                exec->steps.size(),
                                task.steps_statuses[index].name, err.what));
  task.skip_remaining(index + 1);
  if (auto r = task.transition_to(TaskStatus::Failure); r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "task " << task.id << ": " << r.error().what;
  }
  persist(*exec);
  finish(exec, TaskCompletion::RunResult::Err(std::move(err)));
}

void TaskEngine::finish(std::shared_ptr<Execution> exec,
                        TaskCompletion::RunResult result) {
  const auto &task = exec->task;
  if (result.is_ok()) {
    exec->sink->write(fmt::format("task {} finished: {}", task.id,
                                  to_string(task.status)));
    BOOST_LOG_SEV(lg_, trivial::info)
        << "task " << task.id << " (" << task.type << ") succeeded";
  } else {
    exec->sink->write(fmt::format("task {} finished: {} ({})", task.id,
                                  to_string(task.status), result.error().what));
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "task " << task.id << " (" << task.type
        << ") failed: " << result.error().what;
  }
  exec->sink->close();
  exec->completion->complete(task, std::move(result));
}

void TaskEngine::persist(const Execution &exec) {
  auto saved = repository_.save(exec.task);
  if (saved.is_err()) {
    // Execution goes on; the in-memory task stays authoritative for the
    // completion value.
    BOOST_LOG_SEV(lg_, trivial::error)
        << "failed to persist task " << exec.task.id << ": "
        << saved.error().what;
    output_.logger().warning()
        << "Failed to persist task " << exec.task.id << ": "
        << saved.error().what << std::endl;
  }
}

} // namespace kubeplane::workflows
