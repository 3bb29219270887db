#include "workflows/task_completion.hpp"

#include <utility>

#include <boost/asio/post.hpp>

#include "my_error_codes.hpp"

namespace kubeplane::workflows {

TaskCompletion::TaskCompletion(boost::asio::io_context &ioc,
                               std::string task_id)
    : ioc_(ioc), task_id_(std::move(task_id)) {}

bool TaskCompletion::complete(Task final_task, RunResult result) {
  std::vector<Continuation> continuations;
  std::optional<ObserveCallback> observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (result_) {
      return false;
    }
    final_task_ = std::move(final_task);
    result_ = std::move(result);
    continuations = std::move(continuations_);
    continuations_.clear();
    observer = std::move(observer_);
    observer_.reset();
  }

  for (auto &continuation : continuations) {
    schedule(std::move(continuation));
  }
  if (observer) {
    deliver(std::move(*observer));
  }
  return true;
}

monad::IO<void> TaskCompletion::observe() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (observed_) {
      return monad::IO<void>::fail(monad::make_error(
          my_errors::WORKFLOW::ALREADY_OBSERVED,
          "completion of task " + task_id_ + " is already observed"));
    }
    observed_ = true;
  }
  auto self = shared_from_this();
  return monad::IO<void>([self](ObserveCallback cb) {
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      if (!self->result_) {
        self->observer_ = std::move(cb);
        return;
      }
    }
    self->deliver(std::move(cb));
  });
}

void TaskCompletion::on_complete(Continuation continuation) {
  if (!continuation) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!result_) {
      continuations_.push_back(std::move(continuation));
      return;
    }
  }
  schedule(std::move(continuation));
}

bool TaskCompletion::done() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_.has_value();
}

std::optional<Task> TaskCompletion::final_task() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return final_task_;
}

std::optional<TaskCompletion::RunResult> TaskCompletion::result() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_;
}

void TaskCompletion::schedule(Continuation continuation) {
  boost::asio::post(ioc_, [self = shared_from_this(),
                           continuation = std::move(continuation)]() {
    // final_task_ and result_ are immutable once set.
    continuation(*self->final_task_, *self->result_);
  });
}

void TaskCompletion::deliver(ObserveCallback cb) {
  boost::asio::post(ioc_, [self = shared_from_this(), cb = std::move(cb)]() {
    RunResult copy = *self->result_;
    cb(std::move(copy));
  });
}

} // namespace kubeplane::workflows
