#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "model/cloud_provider.hpp"
#include "result_monad.hpp"
#include "workflows/step.hpp"

namespace kubeplane::workflows {

enum class WorkflowIntent { ProvisionCluster, ProvisionNode, DeleteNode, DeleteCluster };

std::string_view to_string(WorkflowIntent intent);
std::optional<WorkflowIntent> parse_workflow_intent(std::string_view value);

// Immutable after build(); safe to share between threads.
//
//   provider x intent  -> workflow kind
//   workflow kind      -> ordered step identifiers
//   step identifier    -> IStep implementation
class WorkflowRegistry {
public:
  struct Mapping {
    model::CloudProvider provider;
    WorkflowIntent intent;
    std::string kind;
  };

  class Builder {
  public:
    Builder &add_step(IStep::Ptr step);
    Builder &add_workflow(std::string kind, std::vector<std::string> step_ids);
    Builder &map(model::CloudProvider provider, WorkflowIntent intent,
                 std::string kind);

    // Fails on duplicate step names, empty workflows, or mappings that point
    // at an unknown kind. Step identifiers are resolved lazily.
    monad::MyResult<std::shared_ptr<const WorkflowRegistry>> build();

  private:
    std::vector<IStep::Ptr> steps_;
    std::vector<std::pair<std::string, std::vector<std::string>>> workflows_;
    std::vector<Mapping> mappings_;
  };

  monad::MyResult<std::string> resolve(model::CloudProvider provider,
                                       WorkflowIntent intent) const;

  monad::MyResult<std::vector<std::string>>
  steps_for(const std::string &kind) const;

  // steps_for() plus resolution of every identifier to its implementation.
  monad::MyResult<std::vector<IStep::Ptr>>
  resolve_steps(const std::string &kind) const;

  monad::MyResult<IStep::Ptr> find_step(const std::string &step_id) const;

  std::vector<std::string> kinds() const;
  std::vector<Mapping> mappings() const;

private:
  WorkflowRegistry() = default;

  std::map<std::string, IStep::Ptr> steps_;
  std::map<std::string, std::vector<std::string>> workflows_;
  std::map<std::pair<model::CloudProvider, WorkflowIntent>, std::string>
      mappings_;
};

// Source of the registry the engine runs against.
class IWorkflowRegistryProvider {
public:
  virtual ~IWorkflowRegistryProvider() = default;
  virtual std::shared_ptr<const WorkflowRegistry> registry() const = 0;
};

class StaticWorkflowRegistryProvider : public IWorkflowRegistryProvider {
public:
  explicit StaticWorkflowRegistryProvider(
      std::shared_ptr<const WorkflowRegistry> registry)
      : registry_(std::move(registry)) {}

  std::shared_ptr<const WorkflowRegistry> registry() const override {
    return registry_;
  }

private:
  std::shared_ptr<const WorkflowRegistry> registry_;
};

} // namespace kubeplane::workflows
