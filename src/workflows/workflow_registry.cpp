#include "workflows/workflow_registry.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace kubeplane::workflows {

std::string_view to_string(WorkflowIntent intent) {
  switch (intent) {
  case WorkflowIntent::ProvisionCluster:
    return "ProvisionCluster";
  case WorkflowIntent::ProvisionNode:
    return "ProvisionNode";
  case WorkflowIntent::DeleteNode:
    return "DeleteNode";
  case WorkflowIntent::DeleteCluster:
    return "DeleteCluster";
  }
  return "Unknown";
}

std::optional<WorkflowIntent> parse_workflow_intent(std::string_view value) {
  for (auto intent :
       {WorkflowIntent::ProvisionCluster, WorkflowIntent::ProvisionNode,
        WorkflowIntent::DeleteNode, WorkflowIntent::DeleteCluster}) {
    if (to_string(intent) == value) {
      return intent;
    }
  }
  return std::nullopt;
}

WorkflowRegistry::Builder &WorkflowRegistry::Builder::add_step(IStep::Ptr step) {
  steps_.push_back(std::move(step));
  return *this;
}

WorkflowRegistry::Builder &
WorkflowRegistry::Builder::add_workflow(std::string kind,
                                        std::vector<std::string> step_ids) {
  workflows_.emplace_back(std::move(kind), std::move(step_ids));
  return *this;
}

WorkflowRegistry::Builder &
WorkflowRegistry::Builder::map(model::CloudProvider provider,
                               WorkflowIntent intent, std::string kind) {
  mappings_.push_back(Mapping{provider, intent, std::move(kind)});
  return *this;
}

monad::MyResult<std::shared_ptr<const WorkflowRegistry>>
WorkflowRegistry::Builder::build() {
  using ReturnType = monad::MyResult<std::shared_ptr<const WorkflowRegistry>>;
  auto fail = [](std::string what) {
    return ReturnType::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT, std::move(what)));
  };

  std::shared_ptr<WorkflowRegistry> registry(new WorkflowRegistry());
  for (auto &step : steps_) {
    if (!step) {
      return fail("null step registered");
    }
    auto name = step->name();
    if (!registry->steps_.emplace(name, step).second) {
      return fail(fmt::format("step '{}' registered twice", name));
    }
  }
  for (auto &[kind, step_ids] : workflows_) {
    if (step_ids.empty()) {
      return fail(fmt::format("workflow '{}' has no steps", kind));
    }
    if (!registry->workflows_.emplace(kind, step_ids).second) {
      return fail(fmt::format("workflow '{}' registered twice", kind));
    }
  }
  for (auto &mapping : mappings_) {
    if (registry->workflows_.count(mapping.kind) == 0) {
      return fail(fmt::format("{}/{} maps to unknown workflow '{}'",
                              model::to_string(mapping.provider),
                              to_string(mapping.intent), mapping.kind));
    }
    registry->mappings_[{mapping.provider, mapping.intent}] = mapping.kind;
  }
  return ReturnType::Ok(std::shared_ptr<const WorkflowRegistry>(registry));
}

monad::MyResult<std::string>
WorkflowRegistry::resolve(model::CloudProvider provider,
                          WorkflowIntent intent) const {
  auto it = mappings_.find({provider, intent});
  if (it == mappings_.end()) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND,
        fmt::format("provider {} does not support {}",
                    model::to_string(provider), to_string(intent))));
  }
  return monad::MyResult<std::string>::Ok(it->second);
}

monad::MyResult<std::vector<std::string>>
WorkflowRegistry::steps_for(const std::string &kind) const {
  auto it = workflows_.find(kind);
  if (it == workflows_.end()) {
    return monad::MyResult<std::vector<std::string>>::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND,
        fmt::format("workflow '{}' is not registered", kind)));
  }
  return monad::MyResult<std::vector<std::string>>::Ok(it->second);
}

monad::MyResult<IStep::Ptr>
WorkflowRegistry::find_step(const std::string &step_id) const {
  auto it = steps_.find(step_id);
  if (it == steps_.end()) {
    return monad::MyResult<IStep::Ptr>::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND,
        fmt::format("step '{}' is not registered", step_id)));
  }
  return monad::MyResult<IStep::Ptr>::Ok(it->second);
}

monad::MyResult<std::vector<IStep::Ptr>>
WorkflowRegistry::resolve_steps(const std::string &kind) const {
  using ReturnType = monad::MyResult<std::vector<IStep::Ptr>>;
  auto ids = steps_for(kind);
  if (ids.is_err()) {
    return ReturnType::Err(std::move(ids).error());
  }
  std::vector<IStep::Ptr> steps;
  steps.reserve(ids.value().size());
  for (const auto &id : ids.value()) {
    auto step = find_step(id);
    if (step.is_err()) {
      return ReturnType::Err(std::move(step).error());
    }
    steps.push_back(step.value());
  }
  return ReturnType::Ok(std::move(steps));
}

std::vector<std::string> WorkflowRegistry::kinds() const {
  std::vector<std::string> out;
  out.reserve(workflows_.size());
  for (const auto &[kind, ids] : workflows_) {
    out.push_back(kind);
  }
  return out;
}

std::vector<WorkflowRegistry::Mapping> WorkflowRegistry::mappings() const {
  std::vector<Mapping> out;
  out.reserve(mappings_.size());
  for (const auto &[key, kind] : mappings_) {
    out.push_back(Mapping{key.first, key.second, kind});
  }
  return out;
}

} // namespace kubeplane::workflows
