#include "workflows/node_provisioner.hpp"

#include <boost/log/sources/record_ostream.hpp>
#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace kubeplane::workflows {

NodeProvisioner::NodeProvisioner(std::shared_ptr<TaskEngine> engine,
                                 ILogSinkFactory &sink_factory,
                                 customio::ConsoleOutput &output)
    : engine_(std::move(engine)), sink_factory_(sink_factory),
      output_(output) {}

std::string NodeProvisioner::generate_node_name(const std::string &cluster_name,
                                                model::NodeRole role) {
  return fmt::format("{}-{}-{}", cluster_name, model::to_string(role),
                     stringutil::random_hex(8));
}

monad::MyResult<std::vector<std::string>> NodeProvisioner::provision_nodes(
    RunContext::Ptr ctx, const std::vector<model::NodeProfile> &profiles,
    const model::Cluster &cluster, const StepConfig &config,
    TaskCompletion::Continuation on_node_done) {
  using ReturnType = monad::MyResult<std::vector<std::string>>;
  auto invalid = [](std::string what) {
    return ReturnType::Err(monad::make_error(
        my_errors::WORKFLOW::VALIDATION_FAILED, std::move(what)));
  };

  if (profiles.empty()) {
    return invalid("no node profiles given");
  }
  if (cluster.name.empty()) {
    return invalid("cluster name is empty");
  }
  if (config.cluster_name != cluster.name) {
    return invalid(fmt::format("config is for cluster {}, not {}",
                               config.cluster_name, cluster.name));
  }

  auto kind = engine_->registry().resolve(config.provider,
                                          WorkflowIntent::ProvisionNode);
  if (kind.is_err()) {
    return ReturnType::Err(std::move(kind).error());
  }

  std::vector<std::string> task_ids;
  task_ids.reserve(profiles.size());
  for (const auto &profile : profiles) {
    model::Node node;
    node.name = generate_node_name(cluster.name, profile.role);
    node.role = profile.role;
    node.provider = std::string(model::to_string(config.provider));
    auto node_config = config.clone_for_node(profile, std::move(node));

    auto task = engine_->create(kind.value());
    if (task.is_err()) {
      return ReturnType::Err(std::move(task).error());
    }
    const auto task_id = task.value().id;

    auto sink = sink_factory_.open(task_id);
    if (sink.is_err()) {
      return ReturnType::Err(std::move(sink).error());
    }

    auto node_name = node_config.node->name;
    ILogSink::Ptr task_sink = std::move(sink).value();
    auto completion = engine_->run(std::move(task).value(),
                                   std::move(node_config), task_sink, ctx);
    if (completion.is_err()) {
      task_sink->close();
      return ReturnType::Err(std::move(completion).error());
    }
    if (on_node_done) {
      completion.value()->on_complete(on_node_done);
    }

    BOOST_LOG_SEV(lg_, trivial::info)
        << "provisioning node " << node_name << " of cluster " << cluster.name
        << " in task " << task_id;
    output_.logger().info() << "Provisioning node " << node_name
                            << " (task " << task_id << ")" << std::endl;
    task_ids.push_back(task_id);
  }
  return ReturnType::Ok(std::move(task_ids));
}

} // namespace kubeplane::workflows
