#pragma once

#include <memory>
#include <string>

#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "kubeplane_common.hpp"
#include "workflows/workflow_registry.hpp"

namespace kubeplane {

// kubeplane workflows <list|show <kind>>
class WorkflowsHandler : public IHandler,
                         public std::enable_shared_from_this<WorkflowsHandler> {
public:
  WorkflowsHandler(CliCtx &cli_ctx, customio::ConsoleOutput &output,
                   workflows::IWorkflowRegistryProvider &registry_provider);

  std::string command() const override { return "workflows"; }
  monad::IO<void> start() override;

private:
  monad::IO<void> handle_list(const workflows::WorkflowRegistry &registry);
  monad::IO<void> handle_show(const workflows::WorkflowRegistry &registry);

  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;
  workflows::IWorkflowRegistryProvider &registry_provider_;
};

} // namespace kubeplane
