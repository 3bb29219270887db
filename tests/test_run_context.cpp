#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "workflows/run_context.hpp"

using kubeplane::workflows::RunContext;

TEST(RunContextTest, CancelRunsCallbacksOnce) {
  auto ctx = RunContext::background();
  int calls = 0;
  std::string seen;
  ctx->on_cancel([&](const std::string &reason) {
    ++calls;
    seen = reason;
  });

  ctx->cancel("user abort");
  ctx->cancel("second reason");

  EXPECT_TRUE(ctx->cancelled());
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(seen, "user abort");
  EXPECT_EQ(ctx->reason().value_or(""), "user abort");
  EXPECT_FALSE(ctx->deadline_exceeded());
}

TEST(RunContextTest, CallbackAfterCancelRunsInline) {
  auto ctx = RunContext::background();
  ctx->cancel("gone");
  std::string seen;
  auto handle = ctx->on_cancel([&](const std::string &reason) { seen = reason; });
  EXPECT_EQ(handle, 0u);
  EXPECT_EQ(seen, "gone");
}

TEST(RunContextTest, RemovedCallbackDoesNotRun) {
  auto ctx = RunContext::background();
  bool called = false;
  auto handle = ctx->on_cancel([&](const std::string &) { called = true; });
  ctx->remove_on_cancel(handle);
  ctx->cancel("x");
  EXPECT_FALSE(called);
}

TEST(RunContextTest, ParentCancelReachesChildren) {
  auto root = RunContext::background();
  auto child = RunContext::with_cancel(root);
  auto grandchild = RunContext::with_cancel(child);

  root->cancel("shutdown");
  EXPECT_TRUE(child->cancelled());
  EXPECT_TRUE(grandchild->cancelled());
  EXPECT_EQ(grandchild->reason().value_or(""), "shutdown");
}

TEST(RunContextTest, ChildCancelLeavesParentAlone) {
  auto root = RunContext::background();
  auto child = RunContext::with_cancel(root);
  child->cancel("only me");
  EXPECT_FALSE(root->cancelled());
}

TEST(RunContextTest, ChildOfCancelledParentStartsCancelled) {
  auto root = RunContext::background();
  root->cancel("early");
  auto child = RunContext::with_cancel(root);
  EXPECT_TRUE(child->cancelled());
  EXPECT_EQ(child->reason().value_or(""), "early");
}

TEST(RunContextTest, DeadlineCancelsContext) {
  boost::asio::io_context ioc;
  auto guard = boost::asio::make_work_guard(ioc);
  std::thread runner([&ioc]() { ioc.run(); });

  auto ctx = RunContext::with_deadline(ioc, std::chrono::milliseconds(20));
  std::atomic<bool> fired{false};
  ctx->on_cancel([&](const std::string &) { fired = true; });

  for (int i = 0; i < 200 && !fired.load(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(fired.load());
  EXPECT_TRUE(ctx->deadline_exceeded());
  EXPECT_EQ(ctx->reason().value_or(""), RunContext::kDeadlineExceeded);

  ctx.reset();
  guard.reset();
  ioc.stop();
  runner.join();
}

TEST(RunContextTest, DeadlineContextFollowsParent) {
  boost::asio::io_context ioc;
  auto root = RunContext::background();
  auto ctx = RunContext::with_deadline(ioc, std::chrono::hours(1), root);
  root->cancel("stop");
  EXPECT_TRUE(ctx->cancelled());
  EXPECT_FALSE(ctx->deadline_exceeded());
  ctx.reset();
  ioc.run();
}
