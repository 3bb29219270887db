#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "my_error_codes.hpp"
#include "workflows/task_completion.hpp"

using namespace kubeplane::workflows;

namespace {

Task finished_task(TaskStatus status) {
  Task task;
  task.id = "t-1";
  task.type = "Kind";
  task.status = status;
  return task;
}

} // namespace

TEST(TaskCompletionTest, ObserverGetsPublishedResult) {
  boost::asio::io_context ioc;
  auto completion = std::make_shared<TaskCompletion>(ioc, "t-1");

  std::optional<TaskCompletion::RunResult> seen;
  completion->observe().run(
      [&seen](TaskCompletion::RunResult r) { seen = std::move(r); });
  EXPECT_FALSE(completion->done());

  EXPECT_TRUE(completion->complete(finished_task(TaskStatus::Success),
                                   TaskCompletion::RunResult::Ok()));
  ioc.run();

  ASSERT_TRUE(seen.has_value());
  EXPECT_TRUE(seen->is_ok());
  EXPECT_TRUE(completion->done());
  EXPECT_EQ(completion->final_task()->status, TaskStatus::Success);
}

TEST(TaskCompletionTest, ObserveAfterCompleteStillDelivers) {
  boost::asio::io_context ioc;
  auto completion = std::make_shared<TaskCompletion>(ioc, "t-1");
  completion->complete(
      finished_task(TaskStatus::Failure),
      TaskCompletion::RunResult::Err(
          monad::make_error(my_errors::WORKFLOW::STEP_FAILED, "nope")));

  std::optional<TaskCompletion::RunResult> seen;
  completion->observe().run(
      [&seen](TaskCompletion::RunResult r) { seen = std::move(r); });
  ioc.run();

  ASSERT_TRUE(seen.has_value());
  ASSERT_TRUE(seen->is_err());
  EXPECT_EQ(seen->error().code, my_errors::WORKFLOW::STEP_FAILED);
}

TEST(TaskCompletionTest, SecondObserveIsRejected) {
  boost::asio::io_context ioc;
  auto completion = std::make_shared<TaskCompletion>(ioc, "t-1");
  auto first = completion->observe();

  std::optional<TaskCompletion::RunResult> second;
  completion->observe().run(
      [&second](TaskCompletion::RunResult r) { second = std::move(r); });
  ioc.run();
  ioc.restart();

  ASSERT_TRUE(second.has_value());
  ASSERT_TRUE(second->is_err());
  EXPECT_EQ(second->error().code, my_errors::WORKFLOW::ALREADY_OBSERVED);
}

TEST(TaskCompletionTest, OnlyFirstCompleteCounts) {
  boost::asio::io_context ioc;
  auto completion = std::make_shared<TaskCompletion>(ioc, "t-1");
  EXPECT_TRUE(completion->complete(finished_task(TaskStatus::Success),
                                   TaskCompletion::RunResult::Ok()));
  EXPECT_FALSE(completion->complete(
      finished_task(TaskStatus::Failure),
      TaskCompletion::RunResult::Err(
          monad::make_error(my_errors::WORKFLOW::STEP_FAILED, "late"))));
  EXPECT_TRUE(completion->result()->is_ok());
  EXPECT_EQ(completion->final_task()->status, TaskStatus::Success);
}

TEST(TaskCompletionTest, ContinuationsRunOnceEach) {
  boost::asio::io_context ioc;
  auto completion = std::make_shared<TaskCompletion>(ioc, "t-1");
  std::vector<std::string> order;
  completion->on_complete(
      [&order](const Task &task, const TaskCompletion::RunResult &r) {
        order.push_back("before:" + task.id + (r.is_ok() ? ":ok" : ":err"));
      });
  completion->complete(finished_task(TaskStatus::Success),
                       TaskCompletion::RunResult::Ok());
  completion->on_complete(
      [&order](const Task &, const TaskCompletion::RunResult &) {
        order.push_back("after");
      });
  EXPECT_TRUE(order.empty());

  ioc.run();
  ASSERT_EQ(order.size(), 2u);
  EXPECT_EQ(order[0], "before:t-1:ok");
  EXPECT_EQ(order[1], "after");
}
