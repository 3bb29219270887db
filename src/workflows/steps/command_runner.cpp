#include "workflows/steps/command_runner.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include <boost/asio/post.hpp>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "my_error_codes.hpp"

namespace kubeplane::workflows::steps {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kTermGrace = std::chrono::seconds(2);

// Splits the child's output into lines for the sink.
class LineBuffer {
public:
  explicit LineBuffer(ILogSink &sink) : sink_(sink) {}

  void feed(const char *data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
      if (data[i] == '\n') {
        flush();
      } else if (data[i] != '\r') {
        pending_.push_back(data[i]);
      }
    }
  }

  void flush() {
    if (!pending_.empty()) {
      sink_.write(pending_);
      pending_.clear();
    }
  }

private:
  ILogSink &sink_;
  std::string pending_;
};

void drain(int fd, LineBuffer &lines) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      lines.feed(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    return;
  }
}

// SIGTERM to the child's process group, SIGKILL if it is still around after
// the grace period. Always reaps the child.
void terminate_child(pid_t pid, int &status) {
  ::kill(-pid, SIGTERM);
  auto deadline = std::chrono::steady_clock::now() + kTermGrace;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid || (w == -1 && errno != EINTR)) {
      return;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  ::kill(-pid, SIGKILL);
  while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

std::string describe_exit(int status) {
  std::ostringstream oss;
  if (WIFEXITED(status)) {
    oss << "command exited with code " << WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    oss << "command killed by signal " << WTERMSIG(status);
  } else {
    oss << "unknown command result";
  }
  return oss.str();
}

} // namespace

CommandRunner::CommandRunner(std::size_t threads)
    : pool_(threads == 0 ? 1 : threads) {}

CommandRunner::~CommandRunner() { shutdown(); }

void CommandRunner::shutdown() {
  shutting_down_.store(true);
  // Queued commands still run their handler and fail without starting.
  pool_.join();
}

monad::IO<void> CommandRunner::run(CommandSpec spec, RunContext::Ptr ctx,
                                   ILogSink::Ptr sink) {
  using ReturnIO = monad::IO<void>;
  if (spec.argv.empty() || spec.argv.front().empty()) {
    return ReturnIO::fail(monad::make_error(
        my_errors::WORKFLOW::VALIDATION_FAILED, "empty command"));
  }
  return ReturnIO([this, spec = std::move(spec), ctx = std::move(ctx),
                   sink = std::move(sink)](ReturnIO::Callback cb) mutable {
    if (shutting_down_.load()) {
      cb(monad::MyVoidResult::Err(monad::make_error(
          my_errors::WORKFLOW::COMMAND_FAILED, "command runner is shut down")));
      return;
    }
    boost::asio::post(pool_, [this, spec = std::move(spec),
                              ctx = std::move(ctx), sink = std::move(sink),
                              cb = std::move(cb)]() mutable {
      if (shutting_down_.load()) {
        cb(monad::MyVoidResult::Err(
            monad::make_error(my_errors::WORKFLOW::COMMAND_FAILED,
                              "command runner is shut down")));
        return;
      }
      auto err = run_blocking(spec, *ctx, *sink, shutting_down_);
      if (err) {
        cb(monad::MyVoidResult::Err(monad::make_error(
            my_errors::WORKFLOW::COMMAND_FAILED, std::move(*err))));
        return;
      }
      cb(monad::MyVoidResult::Ok());
    });
  });
}

std::optional<std::string>
CommandRunner::run_blocking(const CommandSpec &spec, const RunContext &ctx,
                            ILogSink &sink,
                            const std::atomic<bool> &shutting_down) {
  if (spec.argv.empty()) {
    return std::string("empty command");
  }

  int fds[2];
  if (::pipe(fds) != 0) {
    return std::string("pipe failed: ") + std::strerror(errno);
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);

  std::vector<char *> cargv;
  for (auto &s : spec.argv) {
    cargv.push_back(const_cast<char *>(s.c_str()));
  }
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    int saved = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    return std::string("fork failed: ") + std::strerror(saved);
  }

  if (pid == 0) {
    // child: own process group so a kill reaches grandchildren too
    ::setpgid(0, 0);
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    for (const auto &[key, value] : spec.env) {
      ::setenv(key.c_str(), value.c_str(), 1);
    }
    ::execvp(cargv[0], cargv.data());
    _exit(127);
  }

  ::close(fds[1]);
  int read_fd = fds[0];
  ::fcntl(read_fd, F_SETFL, ::fcntl(read_fd, F_GETFL) | O_NONBLOCK);

  LineBuffer lines(sink);
  int status = 0;
  const auto start = std::chrono::steady_clock::now();
  std::optional<std::string> aborted;

  while (true) {
    struct pollfd pfd {
      read_fd, POLLIN, 0
    };
    int pr = ::poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
    if (pr > 0) {
      drain(read_fd, lines);
    }

    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      break;
    }
    if (w == -1 && errno != EINTR) {
      int saved = errno;
      ::close(read_fd);
      return std::string("waitpid failed: ") + std::strerror(saved);
    }

    if (ctx.cancelled()) {
      aborted = "command cancelled: " + ctx.reason().value_or("cancelled");
    } else if (shutting_down.load()) {
      aborted = std::string("command aborted on shutdown");
    } else if (std::chrono::steady_clock::now() - start >= spec.timeout) {
      aborted = std::string("command timed out");
    }
    if (aborted) {
      terminate_child(pid, status);
      break;
    }
  }

  drain(read_fd, lines);
  lines.flush();
  ::close(read_fd);

  if (aborted) {
    return aborted;
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return std::nullopt;
  }
  return describe_exit(status);
}

} // namespace kubeplane::workflows::steps
