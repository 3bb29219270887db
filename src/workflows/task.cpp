#include "workflows/task.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace kubeplane::workflows {

namespace {

monad::MyVoidResult invalid_transition(std::string what) {
  return monad::MyVoidResult::Err(
      monad::make_error(my_errors::WORKFLOW::INVALID_TRANSITION, std::move(what)));
}

monad::MyVoidResult check_index(const Task &task, std::size_t index) {
  if (index >= task.steps_statuses.size()) {
    return invalid_transition(fmt::format(
        "task {} has no step #{} ({} steps)", task.id, index,
        task.steps_statuses.size()));
  }
  return monad::MyVoidResult::Ok();
}

} // namespace

std::string_view to_string(TaskStatus status) {
  switch (status) {
  case TaskStatus::Pending:
    return "pending";
  case TaskStatus::Running:
    return "running";
  case TaskStatus::Success:
    return "success";
  case TaskStatus::Failure:
    return "failure";
  }
  return "unknown";
}

std::string_view to_string(StepState state) {
  switch (state) {
  case StepState::Pending:
    return "pending";
  case StepState::Running:
    return "running";
  case StepState::Success:
    return "success";
  case StepState::Failure:
    return "failure";
  case StepState::Skipped:
    return "skipped";
  }
  return "unknown";
}

std::optional<TaskStatus> parse_task_status(std::string_view value) {
  for (auto s : {TaskStatus::Pending, TaskStatus::Running, TaskStatus::Success,
                 TaskStatus::Failure}) {
    if (to_string(s) == value) {
      return s;
    }
  }
  return std::nullopt;
}

std::optional<StepState> parse_step_state(std::string_view value) {
  for (auto s : {StepState::Pending, StepState::Running, StepState::Success,
                 StepState::Failure, StepState::Skipped}) {
    if (to_string(s) == value) {
      return s;
    }
  }
  return std::nullopt;
}

std::int64_t now_epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

monad::MyVoidResult Task::transition_to(TaskStatus next) {
  const bool allowed =
      (status == TaskStatus::Pending &&
       (next == TaskStatus::Running || next == TaskStatus::Failure)) ||
      (status == TaskStatus::Running &&
       (next == TaskStatus::Success || next == TaskStatus::Failure));
  if (!allowed) {
    return invalid_transition(fmt::format("task {}: {} -> {} is not allowed",
                                          id, to_string(status),
                                          to_string(next)));
  }
  status = next;
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult Task::mark_step_running(std::size_t index,
                                            std::int64_t now_ms) {
  if (auto r = check_index(*this, index); r.is_err()) {
    return r;
  }
  auto &step = steps_statuses[index];
  if (status != TaskStatus::Running || step.state != StepState::Pending) {
    return invalid_transition(fmt::format(
        "task {}: cannot start step '{}' (task {}, step {})", id, step.name,
        to_string(status), to_string(step.state)));
  }
  step.state = StepState::Running;
  step.started_at_ms = now_ms;
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult Task::mark_step_succeeded(std::size_t index,
                                              std::int64_t now_ms) {
  if (auto r = check_index(*this, index); r.is_err()) {
    return r;
  }
  auto &step = steps_statuses[index];
  if (step.state != StepState::Running) {
    return invalid_transition(fmt::format(
        "task {}: step '{}' is {} and cannot succeed", id, step.name,
        to_string(step.state)));
  }
  step.state = StepState::Success;
  step.finished_at_ms = now_ms;
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult Task::mark_step_failed(std::size_t index,
                                           std::string reason,
                                           std::int64_t now_ms) {
  if (auto r = check_index(*this, index); r.is_err()) {
    return r;
  }
  auto &step = steps_statuses[index];
  // A step may fail before it started (cancelled between steps).
  if (step.state != StepState::Running && step.state != StepState::Pending) {
    return invalid_transition(fmt::format(
        "task {}: step '{}' is {} and cannot fail", id, step.name,
        to_string(step.state)));
  }
  step.state = StepState::Failure;
  step.error_message = std::move(reason);
  if (!step.started_at_ms) {
    step.started_at_ms = now_ms;
  }
  step.finished_at_ms = now_ms;
  return monad::MyVoidResult::Ok();
}

void Task::skip_remaining(std::size_t from) {
  for (std::size_t i = from; i < steps_statuses.size(); ++i) {
    if (steps_statuses[i].state == StepState::Pending) {
      steps_statuses[i].state = StepState::Skipped;
    }
  }
}

StepStatus tag_invoke(const json::value_to_tag<StepStatus> &,
                      const json::value &jv) {
  auto const *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("StepStatus is not an object");
  }
  StepStatus status;
  if (auto const *p = obj->if_contains("name"); p && p->is_string()) {
    status.name = json::value_to<std::string>(*p);
  }
  if (auto const *p = obj->if_contains("description"); p && p->is_string()) {
    status.description = json::value_to<std::string>(*p);
  }
  if (auto const *p = obj->if_contains("status"); p && p->is_string()) {
    auto parsed = parse_step_state(p->as_string());
    if (!parsed) {
      throw std::runtime_error("unknown step status '" +
                               std::string(p->as_string()) + "'");
    }
    status.state = *parsed;
  }
  if (auto const *p = obj->if_contains("errorMessage"); p && p->is_string()) {
    status.error_message = json::value_to<std::string>(*p);
  }
  if (auto const *p = obj->if_contains("startedAt"); p && p->is_int64()) {
    status.started_at_ms = p->as_int64();
  }
  if (auto const *p = obj->if_contains("finishedAt"); p && p->is_int64()) {
    status.finished_at_ms = p->as_int64();
  }
  return status;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const StepStatus &status) {
  json::object o;
  o["name"] = status.name;
  o["description"] = status.description;
  o["status"] = to_string(status.state);
  if (status.error_message) {
    o["errorMessage"] = *status.error_message;
  }
  if (status.started_at_ms) {
    o["startedAt"] = *status.started_at_ms;
  }
  if (status.finished_at_ms) {
    o["finishedAt"] = *status.finished_at_ms;
  }
  jv = std::move(o);
}

Task tag_invoke(const json::value_to_tag<Task> &, const json::value &jv) {
  auto const *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("Task is not an object");
  }
  Task task;
  if (auto const *p = obj->if_contains("id"); p && p->is_string()) {
    task.id = json::value_to<std::string>(*p);
  } else {
    throw std::runtime_error("Task is missing 'id'");
  }
  if (auto const *p = obj->if_contains("type"); p && p->is_string()) {
    task.type = json::value_to<std::string>(*p);
  }
  if (auto const *p = obj->if_contains("status"); p && p->is_string()) {
    auto parsed = parse_task_status(p->as_string());
    if (!parsed) {
      throw std::runtime_error("unknown task status '" +
                               std::string(p->as_string()) + "'");
    }
    task.status = *parsed;
  }
  if (auto const *p = obj->if_contains("stepsStatuses"); p && p->is_array()) {
    task.steps_statuses = json::value_to<std::vector<StepStatus>>(*p);
  }
  if (auto const *p = obj->if_contains("config"); p && p->is_object()) {
    task.config = json::value_to<StepConfig>(*p);
  }
  return task;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const Task &task) {
  jv = json::object{{"id", task.id},
                    {"type", task.type},
                    {"status", to_string(task.status)},
                    {"stepsStatuses", json::value_from(task.steps_statuses)},
                    {"config", json::value_from(task.config)}};
}

monad::MyResult<Task> decode_task(std::string_view raw) {
  try {
    auto jv = json::parse(raw);
    return monad::MyResult<Task>::Ok(json::value_to<Task>(jv));
  } catch (const std::exception &ex) {
    return monad::MyResult<Task>::Err(monad::make_error(
        my_errors::JSON::DECODE_ERROR,
        std::string("failed to decode task: ") + ex.what()));
  }
}

std::string encode_task(const Task &task) {
  return json::serialize(json::value_from(task));
}

} // namespace kubeplane::workflows
