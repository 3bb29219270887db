#include "workflows/log_sink.hpp"

#include <system_error>

#include "my_error_codes.hpp"

namespace kubeplane::workflows {

FileLogSink::FileLogSink(std::filesystem::path path) : path_(std::move(path)) {}

FileLogSink::~FileLogSink() { close(); }

monad::MyVoidResult FileLogSink::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::FILE_READ_WRITE,
        "failed to create log directory '" + path_.parent_path().string() +
            "': " + ec.message()));
  }
  ofs_.open(path_, std::ios::binary | std::ios::app);
  if (!ofs_.is_open()) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::GENERAL::FILE_READ_WRITE,
                          "failed to open task log " + path_.string()));
  }
  return monad::MyVoidResult::Ok();
}

void FileLogSink::write(std::string_view line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || !ofs_.is_open()) {
    return;
  }
  ofs_ << line;
  if (line.empty() || line.back() != '\n') {
    ofs_ << '\n';
  }
  ofs_.flush();
}

void FileLogSink::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  if (ofs_.is_open()) {
    ofs_.close();
  }
}

bool FileLogSink::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

FileLogSinkFactory::FileLogSinkFactory(
    IKubeplaneConfigProvider &config_provider, customio::ConsoleOutput &output)
    : config_provider_(config_provider), output_(output) {}

std::filesystem::path
FileLogSinkFactory::log_path(const std::string &task_id) const {
  return config_provider_.get().resolved_task_logs_dir() / (task_id + ".log");
}

monad::MyResult<ILogSink::Ptr>
FileLogSinkFactory::open(const std::string &task_id) {
  if (task_id.empty()) {
    return monad::MyResult<ILogSink::Ptr>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "task id is empty"));
  }
  auto sink = std::make_shared<FileLogSink>(log_path(task_id));
  if (auto r = sink->open(); r.is_err()) {
    output_.logger().error() << "Unable to open log sink for task " << task_id
                             << ": " << r.error().what << std::endl;
    return monad::MyResult<ILogSink::Ptr>::Err(std::move(r).error());
  }
  output_.logger().debug() << "Task " << task_id << " logs to "
                           << sink->path() << std::endl;
  return monad::MyResult<ILogSink::Ptr>::Ok(ILogSink::Ptr(std::move(sink)));
}

} // namespace kubeplane::workflows
