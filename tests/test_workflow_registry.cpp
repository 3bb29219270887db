#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>

#include "my_error_codes.hpp"
#include "workflow_test_support.hpp"
#include "workflows/default_workflows.hpp"
#include "workflows/steps/shell_command_step.hpp"
#include "workflows/workflow_registry.hpp"

using namespace kubeplane::workflows;
using kubeplane::model::CloudProvider;
using testinfra::FakeStep;

namespace {

IStep::Ptr fake(const std::string &name) {
  return std::make_shared<FakeStep>(name, FakeStep::Mode::Succeed);
}

} // namespace

TEST(WorkflowRegistryTest, ResolvesMappedKindAndSteps) {
  WorkflowRegistry::Builder builder;
  builder.add_step(fake("a"))
      .add_step(fake("b"))
      .add_workflow("TwoSteps", {"a", "b"})
      .map(CloudProvider::AWS, WorkflowIntent::ProvisionNode, "TwoSteps");
  auto built = builder.build();
  ASSERT_TRUE(built.is_ok()) << built.error().what;
  auto registry = built.value();

  auto kind = registry->resolve(CloudProvider::AWS, WorkflowIntent::ProvisionNode);
  ASSERT_TRUE(kind.is_ok());
  EXPECT_EQ(kind.value(), "TwoSteps");

  auto ids = registry->steps_for("TwoSteps");
  ASSERT_TRUE(ids.is_ok());
  EXPECT_EQ(ids.value(), (std::vector<std::string>{"a", "b"}));

  auto steps = registry->resolve_steps("TwoSteps");
  ASSERT_TRUE(steps.is_ok());
  ASSERT_EQ(steps.value().size(), 2u);
  EXPECT_EQ(steps.value()[0]->name(), "a");
  EXPECT_EQ(steps.value()[1]->name(), "b");
}

TEST(WorkflowRegistryTest, UnsupportedIntentIsNotFound) {
  WorkflowRegistry::Builder builder;
  builder.add_step(fake("a")).add_workflow("One", {"a"}).map(
      CloudProvider::AWS, WorkflowIntent::DeleteNode, "One");
  auto registry = builder.build().value();

  auto r = registry->resolve(CloudProvider::GCE, WorkflowIntent::DeleteNode);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::NOT_FOUND);
  EXPECT_NE(r.error().what.find("does not support DeleteNode"),
            std::string::npos);

  EXPECT_TRUE(registry->steps_for("Missing").is_err());
}

TEST(WorkflowRegistryTest, UnknownStepFailsOnlyWhenResolved) {
  WorkflowRegistry::Builder builder;
  builder.add_step(fake("a")).add_workflow("Broken", {"a", "ghost"});
  auto built = builder.build();
  ASSERT_TRUE(built.is_ok());

  auto steps = built.value()->resolve_steps("Broken");
  ASSERT_TRUE(steps.is_err());
  EXPECT_EQ(steps.error().code, my_errors::GENERAL::NOT_FOUND);
  EXPECT_NE(steps.error().what.find("ghost"), std::string::npos);
}

TEST(WorkflowRegistryTest, BuildRejectsInconsistentDefinitions) {
  {
    WorkflowRegistry::Builder builder;
    builder.add_step(fake("a")).add_step(fake("a"));
    auto r = builder.build();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, my_errors::GENERAL::INVALID_ARGUMENT);
  }
  {
    WorkflowRegistry::Builder builder;
    builder.add_workflow("Empty", {});
    EXPECT_TRUE(builder.build().is_err());
  }
  {
    WorkflowRegistry::Builder builder;
    builder.add_step(fake("a"))
        .add_workflow("One", {"a"})
        .add_workflow("One", {"a"});
    EXPECT_TRUE(builder.build().is_err());
  }
  {
    WorkflowRegistry::Builder builder;
    builder.map(CloudProvider::Azure, WorkflowIntent::DeleteCluster, "Nope");
    auto r = builder.build();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error().what.find("Nope"), std::string::npos);
  }
}

TEST(WorkflowRegistryTest, IntentNamesParse) {
  for (auto intent :
       {WorkflowIntent::ProvisionCluster, WorkflowIntent::ProvisionNode,
        WorkflowIntent::DeleteNode, WorkflowIntent::DeleteCluster}) {
    auto parsed = parse_workflow_intent(to_string(intent));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, intent);
  }
  EXPECT_FALSE(parse_workflow_intent("Reboot").has_value());
}

TEST(DefaultWorkflowsTest, DigitalOceanIntentsAreRegistered) {
  auto runner = std::make_shared<steps::CommandRunner>(1);
  WorkflowRegistry::Builder builder;
  register_default_workflows(builder, runner, std::chrono::seconds(30));
  auto built = builder.build();
  ASSERT_TRUE(built.is_ok()) << built.error().what;
  auto registry = built.value();

  auto del_cluster = registry->resolve(CloudProvider::DigitalOcean,
                                       WorkflowIntent::DeleteCluster);
  ASSERT_TRUE(del_cluster.is_ok());
  EXPECT_EQ(del_cluster.value(), kDigitalOceanDeleteCluster);

  auto del_node = registry->resolve(CloudProvider::DigitalOcean,
                                    WorkflowIntent::DeleteNode);
  ASSERT_TRUE(del_node.is_ok());
  auto node_steps = registry->steps_for(del_node.value());
  ASSERT_TRUE(node_steps.is_ok());
  EXPECT_EQ(node_steps.value(), (std::vector<std::string>{"do_delete_droplet"}));

  auto provision = registry->resolve(CloudProvider::DigitalOcean,
                                     WorkflowIntent::ProvisionNode);
  ASSERT_TRUE(provision.is_ok());
  EXPECT_EQ(provision.value(), kDigitalOceanNode);

  // Every referenced step exists.
  for (const auto &kind : registry->kinds()) {
    EXPECT_TRUE(registry->resolve_steps(kind).is_ok()) << kind;
  }
  EXPECT_TRUE(registry
                  ->resolve(CloudProvider::DigitalOcean,
                            WorkflowIntent::ProvisionCluster)
                  .is_err());
  runner->shutdown();
}

TEST(DefaultWorkflowsTest, DeleteDropletRendersNodeAndToken) {
  auto runner = std::make_shared<steps::CommandRunner>(1);
  WorkflowRegistry::Builder builder;
  register_default_workflows(builder, runner, std::chrono::seconds(30));
  auto registry = builder.build().value();

  auto step = registry->find_step("do_delete_droplet");
  ASSERT_TRUE(step.is_ok());
  auto shell = std::dynamic_pointer_cast<steps::ShellCommandStep>(step.value());
  ASSERT_TRUE(shell);

  StepConfig config;
  config.cluster_name = "alpha";
  config.provider = CloudProvider::DigitalOcean;
  config.credentials["access_token"] = "tok";
  kubeplane::model::Node node;
  node.name = "alpha-node-0011aabb";
  config.node = node;

  auto spec = shell->render(config);
  ASSERT_TRUE(spec.is_ok()) << spec.error().what;
  const auto &argv = spec.value().argv;
  ASSERT_FALSE(argv.empty());
  EXPECT_EQ(argv.front(), "doctl");
  EXPECT_NE(std::find(argv.begin(), argv.end(), "alpha-node-0011aabb"),
            argv.end());
  EXPECT_EQ(spec.value().env.at("DIGITALOCEAN_ACCESS_TOKEN"), "tok");
  runner->shutdown();
}
