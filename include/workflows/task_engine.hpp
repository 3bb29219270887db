#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include "customio/console_output.hpp"
#include "io_context_manager.hpp"
#include "result_monad.hpp"
#include "workflows/log_sink.hpp"
#include "workflows/run_context.hpp"
#include "workflows/step.hpp"
#include "workflows/step_config.hpp"
#include "workflows/task.hpp"
#include "workflows/task_completion.hpp"
#include "workflows/task_repository.hpp"
#include "workflows/workflow_registry.hpp"

namespace kubeplane::workflows {

namespace src = boost::log::sources;
namespace trivial = boost::log::trivial;

// Drives tasks through their workflow steps on the shared io_context.
//
// Steps of one task run strictly one after another; different tasks
// interleave freely on the io_context worker threads. The engine never
// retries a step. Every state change is persisted before the next step
// starts, and the completion is published only after the terminal state
// has been written.
class TaskEngine : public std::enable_shared_from_this<TaskEngine> {
public:
  using Ptr = std::shared_ptr<TaskEngine>;

  TaskEngine(cjj365::IoContextManager &io_context_manager,
             IWorkflowRegistryProvider &registry_provider,
             TaskRepository &repository, customio::ConsoleOutput &output);

  // New pending task for `kind`, already persisted.
  monad::MyResult<Task> create(const std::string &kind);

  // Starts `task` and returns immediately. The config is attached to the
  // task and written once; config.timeout_seconds > 0 bounds the whole run.
  // A task that already left pending is rejected.
  monad::MyResult<TaskCompletion::Ptr> run(Task task, StepConfig config,
                                           ILogSink::Ptr sink,
                                           RunContext::Ptr ctx);

  const WorkflowRegistry &registry() const { return *registry_; }
  boost::asio::io_context &ioc() { return io_context_manager_.ioc(); }

private:
  struct Execution;

  void run_step(std::shared_ptr<Execution> exec, std::size_t index);
  void on_step_result(std::shared_ptr<Execution> exec, std::size_t index,
                      monad::MyVoidResult result);
  void fail_from(std::shared_ptr<Execution> exec, std::size_t index,
                 monad::Error err);
  void finish(std::shared_ptr<Execution> exec, TaskCompletion::RunResult result);
  void persist(const Execution &exec);

  cjj365::IoContextManager &io_context_manager_;
  std::shared_ptr<const WorkflowRegistry> registry_;
  TaskRepository &repository_;
  customio::ConsoleOutput &output_;
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace kubeplane::workflows
