#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "my_error_codes.hpp"
#include "workflow_test_support.hpp"
#include "workflows/steps/command_runner.hpp"
#include "workflows/steps/shell_command_step.hpp"

using namespace kubeplane::workflows;
using namespace kubeplane::workflows::steps;
using testinfra::MemoryLogSink;

namespace {

CommandSpec shell(const std::string &script,
                  std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  CommandSpec spec;
  spec.argv = {"/bin/sh", "-c", script};
  spec.timeout = timeout;
  return spec;
}

monad::MyVoidResult run_and_wait(monad::IO<void> io) {
  std::promise<monad::MyVoidResult> promise;
  auto future = promise.get_future();
  io.run([&promise](monad::MyVoidResult r) { promise.set_value(std::move(r)); });
  if (future.wait_for(std::chrono::seconds(15)) != std::future_status::ready) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::UNEXPECTED_RESULT, "command did not finish"));
  }
  return future.get();
}

StepConfig node_config() {
  StepConfig config;
  config.cluster_name = "alpha";
  config.credentials["access_token"] = "tok-123";
  kubeplane::model::Node node;
  node.name = "alpha-node-1";
  config.node = node;
  return config;
}

} // namespace

TEST(CommandRunnerTest, CapturesOutputLines) {
  MemoryLogSink sink;
  std::atomic<bool> stop{false};
  auto ctx = RunContext::background();
  auto err = CommandRunner::run_blocking(
      shell("echo first; echo second 1>&2"), *ctx, sink, stop);
  EXPECT_FALSE(err.has_value()) << *err;
  EXPECT_TRUE(sink.contains("first"));
  EXPECT_TRUE(sink.contains("second"));
}

TEST(CommandRunnerTest, NonZeroExitIsReported) {
  MemoryLogSink sink;
  std::atomic<bool> stop{false};
  auto ctx = RunContext::background();
  auto err = CommandRunner::run_blocking(shell("exit 3"), *ctx, sink, stop);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(*err, "command exited with code 3");
}

TEST(CommandRunnerTest, MissingBinaryExits127) {
  MemoryLogSink sink;
  std::atomic<bool> stop{false};
  auto ctx = RunContext::background();
  CommandSpec spec;
  spec.argv = {"kubeplane-no-such-binary"};
  auto err = CommandRunner::run_blocking(spec, *ctx, sink, stop);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(*err, "command exited with code 127");
}

TEST(CommandRunnerTest, TimeoutKillsChild) {
  MemoryLogSink sink;
  std::atomic<bool> stop{false};
  auto ctx = RunContext::background();
  auto started = std::chrono::steady_clock::now();
  auto err = CommandRunner::run_blocking(
      shell("sleep 30", std::chrono::milliseconds(200)), *ctx, sink, stop);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(*err, "command timed out");
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(CommandRunnerTest, EnvironmentIsOverlaid) {
  MemoryLogSink sink;
  std::atomic<bool> stop{false};
  auto ctx = RunContext::background();
  auto spec = shell("echo token=$KUBEPLANE_TEST_TOKEN");
  spec.env["KUBEPLANE_TEST_TOKEN"] = "abc";
  auto err = CommandRunner::run_blocking(spec, *ctx, sink, stop);
  EXPECT_FALSE(err.has_value());
  EXPECT_TRUE(sink.contains("token=abc"));
}

TEST(CommandRunnerTest, CancelKillsRunningCommand) {
  CommandRunner runner(1);
  auto ctx = RunContext::with_cancel(RunContext::background());
  auto sink = std::make_shared<MemoryLogSink>();

  std::promise<monad::MyVoidResult> promise;
  auto future = promise.get_future();
  runner.run(shell("echo started; sleep 30"), ctx, sink)
      .run([&promise](monad::MyVoidResult r) { promise.set_value(std::move(r)); });

  for (int i = 0; i < 200 && !sink->contains("started"); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  ctx->cancel("operator abort");

  ASSERT_EQ(future.wait_for(std::chrono::seconds(10)),
            std::future_status::ready);
  auto result = future.get();
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().code, my_errors::WORKFLOW::COMMAND_FAILED);
  EXPECT_EQ(result.error().what, "command cancelled: operator abort");
}

TEST(CommandRunnerTest, RejectedAfterShutdown) {
  CommandRunner runner(1);
  runner.shutdown();
  auto r = run_and_wait(runner.run(shell("true"), RunContext::background(),
                                   std::make_shared<MemoryLogSink>()));
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().what, "command runner is shut down");
}

TEST(CommandRunnerTest, ShutdownFailsQueuedCommands) {
  CommandRunner runner(1);
  auto sink = std::make_shared<MemoryLogSink>();
  std::vector<std::promise<monad::MyVoidResult>> promises(3);
  std::vector<std::future<monad::MyVoidResult>> futures;
  for (auto &p : promises) {
    futures.push_back(p.get_future());
  }
  for (auto &p : promises) {
    runner.run(shell("echo busy; sleep 30"), RunContext::background(), sink)
        .run([&p](monad::MyVoidResult r) { p.set_value(std::move(r)); });
  }
  for (int i = 0; i < 200 && !sink->contains("busy"); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  runner.shutdown();

  // Every callback has run by the time shutdown() returns.
  for (auto &f : futures) {
    ASSERT_EQ(f.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    auto r = f.get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, my_errors::WORKFLOW::COMMAND_FAILED);
  }
}

TEST(ShellCommandStepTest, RendersArgvAndEnvFromConfig) {
  ShellCommandStep::Definition def;
  def.name = "delete_droplet";
  def.argv = {"doctl", "compute", "droplet", "delete", "{node_name}", "--force"};
  def.env = {{"DIGITALOCEAN_ACCESS_TOKEN", "{credential.access_token}"}};
  ShellCommandStep step(def, nullptr);

  auto spec = step.render(node_config());
  ASSERT_TRUE(spec.is_ok()) << spec.error().what;
  EXPECT_EQ(spec.value().argv[4], "alpha-node-1");
  EXPECT_EQ(spec.value().env.at("DIGITALOCEAN_ACCESS_TOKEN"), "tok-123");
  EXPECT_EQ(spec.value().timeout,
            std::chrono::milliseconds(ShellCommandStep::kDefaultTimeout));
}

TEST(ShellCommandStepTest, UnresolvedPlaceholdersAreListed) {
  ShellCommandStep::Definition def;
  def.name = "create";
  def.argv = {"doctl", "--size", "{profile.size}", "--image", "{profile.image}"};
  ShellCommandStep step(def, nullptr);

  auto spec = step.render(node_config());
  ASSERT_TRUE(spec.is_err());
  EXPECT_EQ(spec.error().code, my_errors::WORKFLOW::VALIDATION_FAILED);
  EXPECT_NE(spec.error().what.find("{profile.size}"), std::string::npos);
  EXPECT_NE(spec.error().what.find("{profile.image}"), std::string::npos);
}

TEST(ShellCommandStepTest, RunEchoesCommandWithoutSecrets) {
  auto runner = std::make_shared<CommandRunner>(1);
  ShellCommandStep::Definition def;
  def.name = "echo_node";
  def.argv = {"/bin/sh", "-c", "echo node {node_name}"};
  def.env = {{"SECRET", "{credential.access_token}"}};
  def.timeout = std::chrono::seconds(5);
  ShellCommandStep step(def, runner);

  auto sink = std::make_shared<MemoryLogSink>();
  auto r = run_and_wait(step.run(RunContext::background(), node_config(), sink));
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_TRUE(sink->contains("$ /bin/sh -c echo node alpha-node-1"));
  EXPECT_TRUE(sink->contains("node alpha-node-1"));
  EXPECT_FALSE(sink->contains("tok-123"));
  runner->shutdown();
}

TEST(ShellCommandStepTest, MissingRunnerFails) {
  ShellCommandStep::Definition def;
  def.name = "orphan";
  def.argv = {"true"};
  ShellCommandStep step(def, nullptr);
  auto r = run_and_wait(step.run(RunContext::background(), node_config(),
                                 std::make_shared<MemoryLogSink>()));
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::POINTER_IS_NULL);
}
