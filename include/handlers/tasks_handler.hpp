#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "kubeplane_common.hpp"
#include "workflows/task_repository.hpp"

namespace kubeplane {

// kubeplane tasks <list|show|purge>
class TasksHandler : public IHandler,
                     public std::enable_shared_from_this<TasksHandler> {
public:
  TasksHandler(CliCtx &cli_ctx, customio::ConsoleOutput &output,
               workflows::TaskRepository &repository);

  std::string command() const override { return "tasks"; }
  monad::IO<void> start() override;

private:
  struct Options {
    bool json{false};
    std::optional<std::string> cluster;
  };

  Options parse_options(const std::string &action);

  monad::IO<void> handle_list();
  monad::IO<void> handle_show();
  monad::IO<void> handle_purge();

  void print_task(const workflows::Task &task);

  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;
  workflows::TaskRepository &repository_;
};

} // namespace kubeplane
