#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "io_monad.hpp"
#include "workflows/log_sink.hpp"
#include "workflows/run_context.hpp"

namespace kubeplane::workflows::steps {

struct CommandSpec {
  std::vector<std::string> argv;
  // Overlaid on the inherited environment.
  std::map<std::string, std::string> env;
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

// Runs external commands on a private thread pool so a blocking child never
// occupies an io_context worker. Output lines go to the task sink.
class CommandRunner {
public:
  explicit CommandRunner(std::size_t threads = 4);
  ~CommandRunner();

  CommandRunner(const CommandRunner &) = delete;
  CommandRunner &operator=(const CommandRunner &) = delete;

  // Fails with WORKFLOW::COMMAND_FAILED ("command exited with code N",
  // "command timed out", ...). The child is killed when `ctx` is cancelled.
  monad::IO<void> run(CommandSpec spec, RunContext::Ptr ctx,
                      ILogSink::Ptr sink);

  // Kills running children and fails queued commands; every pending
  // callback is called before this returns.
  void shutdown();

  // Synchronous variant used by run(). Returns nullopt on success.
  static std::optional<std::string>
  run_blocking(const CommandSpec &spec, const RunContext &ctx, ILogSink &sink,
               const std::atomic<bool> &shutting_down);

private:
  boost::asio::thread_pool pool_;
  std::atomic<bool> shutting_down_{false};
};

} // namespace kubeplane::workflows::steps
