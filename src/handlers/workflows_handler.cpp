#include "handlers/workflows_handler.hpp"

#include <boost/json.hpp>
#include <fmt/format.h>

namespace kubeplane {

WorkflowsHandler::WorkflowsHandler(
    CliCtx &cli_ctx, customio::ConsoleOutput &output,
    workflows::IWorkflowRegistryProvider &registry_provider)
    : cli_ctx_(cli_ctx), output_(output),
      registry_provider_(registry_provider) {}

monad::IO<void> WorkflowsHandler::start() {
  auto registry = registry_provider_.registry();
  if (!registry) {
    return monad::IO<void>::fail(monad::make_error(
        my_errors::GENERAL::POINTER_IS_NULL, "workflow registry is not set"));
  }
  const std::string action = cli_ctx_.action();
  if (action.empty() || action == "list") {
    return handle_list(*registry);
  }
  if (action == "show") {
    return handle_show(*registry);
  }
  return monad::IO<void>::fail(
      monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                        "Usage: kubeplane workflows <list|show <kind>>"));
}

monad::IO<void>
WorkflowsHandler::handle_list(const workflows::WorkflowRegistry &registry) {
  auto mappings = registry.mappings();
  if (cli_ctx_.params.json) {
    boost::json::array arr;
    for (const auto &m : mappings) {
      arr.push_back(boost::json::object{
          {"provider", model::to_string(m.provider)},
          {"intent", workflows::to_string(m.intent)},
          {"kind", m.kind}});
    }
    output_.out() << boost::json::serialize(arr) << std::endl;
    return monad::IO<void>::pure();
  }

  output_.out() << fmt::format("{:<14} {:<16} {}\n", "PROVIDER", "INTENT",
                               "KIND");
  for (const auto &m : mappings) {
    output_.out() << fmt::format("{:<14} {:<16} {}\n",
                                 model::to_string(m.provider),
                                 workflows::to_string(m.intent), m.kind);
  }
  output_.out().flush();
  return monad::IO<void>::pure();
}

monad::IO<void>
WorkflowsHandler::handle_show(const workflows::WorkflowRegistry &registry) {
  auto kind = cli_ctx_.argument(0, "Workflow kind");
  if (kind.is_err()) {
    return monad::IO<void>::fail(std::move(kind).error());
  }
  auto steps = registry.resolve_steps(kind.value());
  if (steps.is_err()) {
    return monad::IO<void>::fail(std::move(steps).error());
  }

  if (cli_ctx_.params.json) {
    boost::json::array arr;
    for (const auto &step : steps.value()) {
      arr.push_back(boost::json::object{{"name", step->name()},
                                        {"description", step->description()}});
    }
    output_.out() << boost::json::serialize(
                         boost::json::object{{"kind", kind.value()},
                                             {"steps", std::move(arr)}})
                  << std::endl;
    return monad::IO<void>::pure();
  }

  output_.out() << kind.value() << "\n";
  std::size_t index = 1;
  for (const auto &step : steps.value()) {
    output_.out() << fmt::format("  {}. {:<28} {}\n", index++, step->name(),
                                 step->description());
  }
  output_.out().flush();
  return monad::IO<void>::pure();
}

} // namespace kubeplane
