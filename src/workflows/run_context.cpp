#include "workflows/run_context.hpp"

#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

namespace kubeplane::workflows {

RunContext::Ptr RunContext::background() {
  return Ptr(new RunContext());
}

RunContext::Ptr RunContext::with_cancel(const Ptr &parent) {
  auto ctx = Ptr(new RunContext());
  ctx->link_parent(parent);
  return ctx;
}

RunContext::Ptr RunContext::with_deadline(boost::asio::io_context &ioc,
                                          std::chrono::milliseconds timeout,
                                          const Ptr &parent) {
  auto ctx = Ptr(new RunContext());
  ctx->link_parent(parent);
  auto timer = std::make_shared<boost::asio::steady_timer>(ioc, timeout);
  {
    std::lock_guard<std::mutex> lock(ctx->mutex_);
    ctx->deadline_timer_ = timer;
  }
  timer->async_wait([weak = std::weak_ptr<RunContext>(ctx)](
                        const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->cancel(kDeadlineExceeded);
    }
  });
  return ctx;
}

RunContext::~RunContext() {
  if (auto parent = parent_.lock(); parent && parent_handle_ != 0) {
    parent->remove_on_cancel(parent_handle_);
  }
  if (deadline_timer_) {
    // The timer is only touched from its own executor.
    auto timer = deadline_timer_;
    boost::asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
  }
}

void RunContext::link_parent(const Ptr &parent) {
  if (!parent) {
    return;
  }
  parent_ = parent;
  auto handle = parent->on_cancel(
      [weak = std::weak_ptr<RunContext>(shared_from_this())](
          const std::string &reason) {
        if (auto child = weak.lock()) {
          child->cancel(reason);
        }
      });
  std::lock_guard<std::mutex> lock(mutex_);
  parent_handle_ = handle;
}

void RunContext::cancel(std::string reason) {
  std::map<CallbackHandle, CancelCallback> callbacks;
  std::shared_ptr<boost::asio::steady_timer> timer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    reason_ = std::move(reason);
    callbacks = std::move(callbacks_);
    callbacks_.clear();
    timer = deadline_timer_;
  }
  if (timer) {
    boost::asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
  }
  const std::string reason_copy = this->reason().value_or("");
  for (auto &[handle, cb] : callbacks) {
    if (cb) {
      cb(reason_copy);
    }
  }
}

bool RunContext::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

std::optional<std::string> RunContext::reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cancelled_) {
    return std::nullopt;
  }
  return reason_;
}

bool RunContext::deadline_exceeded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_ && reason_ == kDeadlineExceeded;
}

RunContext::CallbackHandle RunContext::on_cancel(CancelCallback cb) {
  std::string reason;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
      auto handle = next_handle_++;
      callbacks_.emplace(handle, std::move(cb));
      return handle;
    }
    reason = reason_;
  }
  if (cb) {
    cb(reason);
  }
  return 0;
}

void RunContext::remove_on_cancel(CallbackHandle handle) {
  if (handle == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(handle);
}

} // namespace kubeplane::workflows
