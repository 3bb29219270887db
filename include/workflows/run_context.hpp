#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace kubeplane::workflows {

// Cancellation token handed to every step. A context is cancelled
// explicitly, when its deadline expires, or when its parent is cancelled.
// Cancellation is sticky: the first reason wins.
class RunContext : public std::enable_shared_from_this<RunContext> {
public:
  using Ptr = std::shared_ptr<RunContext>;
  using CancelCallback = std::function<void(const std::string &reason)>;
  using CallbackHandle = std::size_t;

  static constexpr const char *kDeadlineExceeded = "deadline exceeded";

  static Ptr background();
  static Ptr with_cancel(const Ptr &parent);
  static Ptr with_deadline(boost::asio::io_context &ioc,
                           std::chrono::milliseconds timeout,
                           const Ptr &parent = nullptr);

  ~RunContext();

  RunContext(const RunContext &) = delete;
  RunContext &operator=(const RunContext &) = delete;

  void cancel(std::string reason);
  bool cancelled() const;
  std::optional<std::string> reason() const;
  bool deadline_exceeded() const;

  // Runs `cb` once on cancellation. If the context is already cancelled
  // `cb` runs inline and 0 is returned.
  CallbackHandle on_cancel(CancelCallback cb);
  void remove_on_cancel(CallbackHandle handle);

private:
  RunContext() = default;
  void link_parent(const Ptr &parent);

  mutable std::mutex mutex_;
  bool cancelled_{false};
  std::string reason_;
  CallbackHandle next_handle_{1};
  std::map<CallbackHandle, CancelCallback> callbacks_;

  std::weak_ptr<RunContext> parent_;
  CallbackHandle parent_handle_{0};
  std::shared_ptr<boost::asio::steady_timer> deadline_timer_;
};

} // namespace kubeplane::workflows
