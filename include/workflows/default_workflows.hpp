#pragma once

#include <chrono>
#include <memory>

#include "conf/kubeplane_config.hpp"
#include "customio/console_output.hpp"
#include "workflows/steps/command_runner.hpp"
#include "workflows/workflow_registry.hpp"

namespace kubeplane::workflows {

inline constexpr const char *kDigitalOceanDeleteCluster =
    "DigitalOceanDeleteCluster";
inline constexpr const char *kDigitalOceanDeleteNode = "DigitalOceanDeleteNode";
inline constexpr const char *kDigitalOceanNode = "DigitalOceanNode";

// Droplets of a cluster carry this tag; "{cluster_name}" is expanded per task.
inline constexpr const char *kClusterTagTemplate = "kubeplane-{cluster_name}";

// DigitalOcean workflows driven through the doctl CLI. The token is taken
// from the account credential "access_token".
void register_default_workflows(WorkflowRegistry::Builder &builder,
                                std::shared_ptr<steps::CommandRunner> runner,
                                std::chrono::seconds step_timeout);

// Registry holding the default workflows; owns the command runner the shell
// steps execute on.
class DefaultWorkflowRegistryProvider : public IWorkflowRegistryProvider {
public:
  DefaultWorkflowRegistryProvider(IKubeplaneConfigProvider &config_provider,
                                  customio::ConsoleOutput &output);
  ~DefaultWorkflowRegistryProvider() override;

  std::shared_ptr<const WorkflowRegistry> registry() const override {
    return registry_;
  }

private:
  std::shared_ptr<steps::CommandRunner> runner_;
  std::shared_ptr<const WorkflowRegistry> registry_;
};

} // namespace kubeplane::workflows
