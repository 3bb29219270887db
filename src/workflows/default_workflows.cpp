#include "workflows/default_workflows.hpp"

#include <algorithm>
#include <stdexcept>

#include "workflows/steps/shell_command_step.hpp"

namespace kubeplane::workflows {

namespace {

using steps::ShellCommandStep;

constexpr std::chrono::seconds kDropletCreateTimeout{300};

const std::map<std::string, std::string> &doctl_env() {
  static const std::map<std::string, std::string> env{
      {"DIGITALOCEAN_ACCESS_TOKEN", "{credential.access_token}"}};
  return env;
}

IStep::Ptr doctl_step(std::shared_ptr<steps::CommandRunner> runner,
                      std::string name, std::string description,
                      std::vector<std::string> args,
                      std::chrono::seconds timeout) {
  ShellCommandStep::Definition def;
  def.name = std::move(name);
  def.description = std::move(description);
  def.argv.push_back("doctl");
  def.argv.insert(def.argv.end(), args.begin(), args.end());
  def.env = doctl_env();
  def.timeout = timeout;
  return std::make_shared<ShellCommandStep>(std::move(def), std::move(runner));
}

} // namespace

void register_default_workflows(WorkflowRegistry::Builder &builder,
                                std::shared_ptr<steps::CommandRunner> runner,
                                std::chrono::seconds step_timeout) {
  const std::string tag = kClusterTagTemplate;

  builder
      .add_step(doctl_step(runner, "do_delete_cluster_droplets",
                           "delete every droplet tagged with the cluster",
                           {"compute", "droplet", "delete", "--tag-name", tag,
                            "--force"},
                           step_timeout))
      .add_step(doctl_step(runner, "do_delete_cluster_tag",
                           "delete the cluster tag",
                           {"compute", "tag", "delete", tag, "--force"},
                           step_timeout))
      .add_step(doctl_step(runner, "do_delete_droplet",
                           "delete the node droplet",
                           {"compute", "droplet", "delete", "{node_name}",
                            "--force"},
                           step_timeout))
      .add_step(doctl_step(
          runner, "do_create_droplet", "create the node droplet",
          {"compute", "droplet", "create", "{node_name}", "--region",
           "{region}", "--size", "{profile.size}", "--image",
           "{profile.image}", "--tag-names",
           tag + ",kubeplane-role-{profile.role}", "--wait"},
          std::max(step_timeout, kDropletCreateTimeout)))
      .add_step(doctl_step(runner, "do_describe_droplet",
                           "print the provisioned droplet",
                           {"compute", "droplet", "get", "{node_name}",
                            "--format", "ID,Name,PublicIPv4,PrivateIPv4,Status"},
                           step_timeout));

  builder
      .add_workflow(kDigitalOceanDeleteCluster,
                    {"do_delete_cluster_droplets", "do_delete_cluster_tag"})
      .add_workflow(kDigitalOceanDeleteNode, {"do_delete_droplet"})
      .add_workflow(kDigitalOceanNode,
                    {"do_create_droplet", "do_describe_droplet"});

  builder
      .map(model::CloudProvider::DigitalOcean, WorkflowIntent::DeleteCluster,
           kDigitalOceanDeleteCluster)
      .map(model::CloudProvider::DigitalOcean, WorkflowIntent::DeleteNode,
           kDigitalOceanDeleteNode)
      .map(model::CloudProvider::DigitalOcean, WorkflowIntent::ProvisionNode,
           kDigitalOceanNode);
}

DefaultWorkflowRegistryProvider::DefaultWorkflowRegistryProvider(
    IKubeplaneConfigProvider &config_provider, customio::ConsoleOutput &output) {
  const auto &config = config_provider.get();
  runner_ = std::make_shared<steps::CommandRunner>(
      static_cast<std::size_t>(std::max(config.command_threads, 1)));

  WorkflowRegistry::Builder builder;
  register_default_workflows(builder, runner_,
                             std::chrono::seconds(config.step_timeout_seconds));
  auto built = builder.build();
  if (built.is_err()) {
    output.logger().error() << "Failed to build workflow registry: "
                            << built.error().what << std::endl;
    throw std::runtime_error("Failed to build workflow registry: " +
                             built.error().what);
  }
  registry_ = std::move(built).value();
  output.logger().debug() << "Registered " << registry_->kinds().size()
                          << " workflows" << std::endl;
}

DefaultWorkflowRegistryProvider::~DefaultWorkflowRegistryProvider() {
  if (runner_) {
    runner_->shutdown();
  }
}

} // namespace kubeplane::workflows
