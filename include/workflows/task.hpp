#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

#include "result_monad.hpp"
#include "workflows/step_config.hpp"

namespace kubeplane::workflows {

namespace json = boost::json;

enum class TaskStatus { Pending, Running, Success, Failure };

enum class StepState { Pending, Running, Success, Failure, Skipped };

std::string_view to_string(TaskStatus status);
std::string_view to_string(StepState state);
std::optional<TaskStatus> parse_task_status(std::string_view value);
std::optional<StepState> parse_step_state(std::string_view value);

struct StepStatus {
  std::string name;
  std::string description;
  StepState state{StepState::Pending};
  std::optional<std::string> error_message;
  std::optional<std::int64_t> started_at_ms;
  std::optional<std::int64_t> finished_at_ms;
};

// A single run of a workflow. The aggregate status only moves forward
// (pending -> running -> success|failure); once a step fails every later
// step is marked skipped and never runs.
struct Task {
  std::string id;
  std::string type; // workflow kind
  TaskStatus status{TaskStatus::Pending};
  std::vector<StepStatus> steps_statuses;
  StepConfig config;

  bool is_terminal() const {
    return status == TaskStatus::Success || status == TaskStatus::Failure;
  }

  monad::MyVoidResult transition_to(TaskStatus next);

  monad::MyVoidResult mark_step_running(std::size_t index,
                                        std::int64_t now_ms);
  monad::MyVoidResult mark_step_succeeded(std::size_t index,
                                          std::int64_t now_ms);
  monad::MyVoidResult mark_step_failed(std::size_t index, std::string reason,
                                       std::int64_t now_ms);
  // Marks every still-pending step from `from` on as skipped.
  void skip_remaining(std::size_t from);
};

std::int64_t now_epoch_ms();

StepStatus tag_invoke(const json::value_to_tag<StepStatus> &,
                      const json::value &jv);
void tag_invoke(const json::value_from_tag &, json::value &jv,
                const StepStatus &status);

Task tag_invoke(const json::value_to_tag<Task> &, const json::value &jv);
void tag_invoke(const json::value_from_tag &, json::value &jv,
                const Task &task);

monad::MyResult<Task> decode_task(std::string_view raw);
std::string encode_task(const Task &task);

} // namespace kubeplane::workflows
