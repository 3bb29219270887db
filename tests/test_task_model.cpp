#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "my_error_codes.hpp"
#include "workflows/task.hpp"

namespace json = boost::json;
using namespace kubeplane::workflows;

namespace {

Task make_task(std::size_t steps) {
  Task task;
  task.id = "task-1";
  task.type = "DigitalOceanNode";
  for (std::size_t i = 0; i < steps; ++i) {
    StepStatus status;
    status.name = "step" + std::to_string(i);
    status.description = "step number " + std::to_string(i);
    task.steps_statuses.push_back(status);
  }
  return task;
}

} // namespace

TEST(TaskModelTest, StatusOnlyMovesForward) {
  auto task = make_task(1);
  EXPECT_TRUE(task.transition_to(TaskStatus::Running).is_ok());
  EXPECT_TRUE(task.transition_to(TaskStatus::Success).is_ok());
  EXPECT_TRUE(task.is_terminal());

  auto back = task.transition_to(TaskStatus::Running);
  ASSERT_TRUE(back.is_err());
  EXPECT_EQ(back.error().code, my_errors::WORKFLOW::INVALID_TRANSITION);
  EXPECT_EQ(task.status, TaskStatus::Success);
}

TEST(TaskModelTest, PendingCannotJumpToSuccess) {
  auto task = make_task(1);
  auto r = task.transition_to(TaskStatus::Success);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(task.status, TaskStatus::Pending);
  // Pending tasks may still be failed directly.
  EXPECT_TRUE(task.transition_to(TaskStatus::Failure).is_ok());
}

TEST(TaskModelTest, StepLifecycleRecordsTimes) {
  auto task = make_task(2);
  ASSERT_TRUE(task.transition_to(TaskStatus::Running).is_ok());

  ASSERT_TRUE(task.mark_step_running(0, 100).is_ok());
  EXPECT_EQ(task.steps_statuses[0].state, StepState::Running);
  EXPECT_EQ(task.steps_statuses[0].started_at_ms, 100);

  ASSERT_TRUE(task.mark_step_succeeded(0, 250).is_ok());
  EXPECT_EQ(task.steps_statuses[0].state, StepState::Success);
  EXPECT_EQ(task.steps_statuses[0].finished_at_ms, 250);

  // Succeeding a step twice is an error.
  EXPECT_TRUE(task.mark_step_succeeded(0, 300).is_err());
  EXPECT_TRUE(task.mark_step_running(5, 300).is_err());
}

TEST(TaskModelTest, StepCannotRunWhileTaskPending) {
  auto task = make_task(1);
  auto r = task.mark_step_running(0, 1);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::WORKFLOW::INVALID_TRANSITION);
}

TEST(TaskModelTest, FailureSkipsTheRest) {
  auto task = make_task(3);
  ASSERT_TRUE(task.transition_to(TaskStatus::Running).is_ok());
  ASSERT_TRUE(task.mark_step_running(0, 1).is_ok());
  ASSERT_TRUE(task.mark_step_failed(0, "droplet quota exceeded", 2).is_ok());
  task.skip_remaining(1);

  EXPECT_EQ(task.steps_statuses[0].state, StepState::Failure);
  ASSERT_TRUE(task.steps_statuses[0].error_message.has_value());
  EXPECT_EQ(*task.steps_statuses[0].error_message, "droplet quota exceeded");
  EXPECT_EQ(task.steps_statuses[1].state, StepState::Skipped);
  EXPECT_EQ(task.steps_statuses[2].state, StepState::Skipped);
}

TEST(TaskModelTest, EncodeDecodeKeepsStepsAndDropsCredentials) {
  auto task = make_task(2);
  task.config.cluster_name = "prod";
  task.config.credentials["access_token"] = "secret-token";
  ASSERT_TRUE(task.transition_to(TaskStatus::Running).is_ok());
  ASSERT_TRUE(task.mark_step_running(0, 10).is_ok());

  auto raw = encode_task(task);
  EXPECT_EQ(raw.find("secret-token"), std::string::npos);

  auto decoded = decode_task(raw);
  ASSERT_TRUE(decoded.is_ok()) << decoded.error().what;
  const auto &t = decoded.value();
  EXPECT_EQ(t.id, "task-1");
  EXPECT_EQ(t.status, TaskStatus::Running);
  EXPECT_EQ(t.config.cluster_name, "prod");
  EXPECT_TRUE(t.config.credentials.empty());
  ASSERT_EQ(t.steps_statuses.size(), 2u);
  EXPECT_EQ(t.steps_statuses[0].state, StepState::Running);
  EXPECT_EQ(t.steps_statuses[0].started_at_ms, 10);
  EXPECT_EQ(t.steps_statuses[1].state, StepState::Pending);
}

TEST(TaskModelTest, DecodeRejectsUnknownStatus) {
  json::object o{{"id", "t"}, {"type", "k"}, {"status", "exploded"}};
  auto decoded = decode_task(json::serialize(o));
  ASSERT_TRUE(decoded.is_err());
  EXPECT_EQ(decoded.error().code, my_errors::JSON::DECODE_ERROR);

  EXPECT_TRUE(decode_task("not json").is_err());
}

TEST(TaskModelTest, StatusNamesRoundTrip) {
  EXPECT_EQ(to_string(TaskStatus::Failure), "failure");
  EXPECT_EQ(parse_task_status("success"), TaskStatus::Success);
  EXPECT_FALSE(parse_task_status("done").has_value());
  EXPECT_EQ(parse_step_state("skipped"), StepState::Skipped);
}
