#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "conf/kubeplane_config.hpp"
#include "customio/console_output.hpp"
#include "result_monad.hpp"

namespace kubeplane::workflows {

// Destination for the human readable output of one task. Safe to use from
// several threads; writes after close() are dropped.
class ILogSink {
public:
  using Ptr = std::shared_ptr<ILogSink>;

  virtual ~ILogSink() = default;
  virtual void write(std::string_view line) = 0;
  virtual void close() = 0;
  virtual bool closed() const = 0;
};

class ILogSinkFactory {
public:
  virtual ~ILogSinkFactory() = default;
  virtual monad::MyResult<ILogSink::Ptr> open(const std::string &task_id) = 0;
};

class FileLogSink : public ILogSink {
public:
  explicit FileLogSink(std::filesystem::path path);
  ~FileLogSink() override;

  monad::MyVoidResult open();

  void write(std::string_view line) override;
  void close() override;
  bool closed() const override;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::ofstream ofs_;
  bool closed_{false};
};

// Lifetime: singleton; sinks it opens are shared with the engine and the
// steps of a single task.
class FileLogSinkFactory : public ILogSinkFactory {
public:
  FileLogSinkFactory(IKubeplaneConfigProvider &config_provider,
                     customio::ConsoleOutput &output);

  monad::MyResult<ILogSink::Ptr> open(const std::string &task_id) override;

  std::filesystem::path log_path(const std::string &task_id) const;

private:
  IKubeplaneConfigProvider &config_provider_;
  customio::ConsoleOutput &output_;
};

} // namespace kubeplane::workflows
