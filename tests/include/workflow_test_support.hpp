#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "conf/kubeplane_config.hpp"
#include "customio/console_output.hpp"
#include "io_context_manager.hpp"
#include "ioc_manager_config_provider.hpp"
#include "log_stream.hpp"
#include "my_error_codes.hpp"
#include "storage/key_value_store.hpp"
#include "test_config_utils.hpp"
#include "workflows/log_sink.hpp"
#include "workflows/step.hpp"
#include "workflows/task_completion.hpp"
#include "workflows/task_engine.hpp"
#include "workflows/task_repository.hpp"
#include "workflows/workflow_registry.hpp"

namespace testinfra {

using kubeplane::workflows::ILogSink;
using kubeplane::workflows::ILogSinkFactory;
using kubeplane::workflows::IStep;
using kubeplane::workflows::RunContext;
using kubeplane::workflows::StepConfig;

class MemoryLogSink : public ILogSink {
public:
  void write(std::string_view line) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
      lines_.emplace_back(line);
    }
  }
  void close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  bool closed() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }
  std::vector<std::string> lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }
  bool contains(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &line : lines_) {
      if (line.find(needle) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  bool closed_{false};
};

class MemoryLogSinkFactory : public ILogSinkFactory {
public:
  monad::MyResult<ILogSink::Ptr> open(const std::string &task_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_next_) {
      fail_next_ = false;
      return monad::MyResult<ILogSink::Ptr>::Err(monad::make_error(
          my_errors::GENERAL::UNEXPECTED_RESULT, "sink unavailable"));
    }
    auto sink = std::make_shared<MemoryLogSink>();
    sinks_.emplace_back(task_id, sink);
    return monad::MyResult<ILogSink::Ptr>::Ok(sink);
  }

  std::shared_ptr<MemoryLogSink> sink_for(const std::string &task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, sink] : sinks_) {
      if (id == task_id) {
        return sink;
      }
    }
    return nullptr;
  }

  void fail_next_open() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = true;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, std::shared_ptr<MemoryLogSink>>> sinks_;
  bool fail_next_{false};
};

// Step whose outcome is chosen by the test.
class FakeStep : public IStep {
public:
  enum class Mode { Succeed, Fail, Block };

  // Failing steps report `error_code` the way a command step would.
  FakeStep(std::string name, Mode mode, std::string error = "boom",
           int error_code = my_errors::WORKFLOW::COMMAND_FAILED)
      : name_(std::move(name)), mode_(mode), error_(std::move(error)),
        error_code_(error_code) {}

  std::string name() const override { return name_; }
  std::string description() const override { return "fake " + name_; }

  monad::IO<void> run(RunContext::Ptr ctx, const StepConfig &config,
                      ILogSink::Ptr sink) override {
    ++runs_;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seen_configs_.push_back(config);
    }
    sink->write(name_ + " working");
    switch (mode_) {
    case Mode::Succeed:
      return monad::IO<void>::pure();
    case Mode::Fail:
      return monad::IO<void>::fail(
          monad::make_error(error_code_, error_));
    case Mode::Block:
      break;
    }
    // Completes only once the context is cancelled.
    return monad::IO<void>([ctx](monad::IO<void>::Callback cb) {
      auto shared_cb =
          std::make_shared<monad::IO<void>::Callback>(std::move(cb));
      ctx->on_cancel([shared_cb](const std::string &reason) {
        (*shared_cb)(monad::MyVoidResult::Err(monad::make_error(
            my_errors::WORKFLOW::CANCELLED, "blocked step gave up: " + reason)));
      });
    });
  }

  int runs() const { return runs_.load(); }
  std::vector<StepConfig> seen_configs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_configs_;
  }

private:
  std::string name_;
  Mode mode_;
  std::string error_;
  int error_code_;
  std::atomic<int> runs_{0};
  mutable std::mutex mutex_;
  std::vector<StepConfig> seen_configs_;
};

// Store wrapper that can be told to fail writes.
class FlakyKeyValueStore : public kubeplane::storage::IKeyValueStore {
public:
  monad::MyResult<std::vector<Entry>>
  list_all(const std::string &prefix) override {
    return inner_.list_all(prefix);
  }
  monad::MyResult<std::string> get(const std::string &prefix,
                                   const std::string &id) override {
    return inner_.get(prefix, id);
  }
  monad::MyVoidResult put(const std::string &prefix, const std::string &id,
                          const std::string &value) override {
    if (fail_puts_.load()) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::WORKFLOW::STORAGE_UNAVAILABLE, "store is down"));
    }
    return inner_.put(prefix, id, value);
  }
  monad::MyVoidResult remove(const std::string &prefix,
                             const std::string &id) override {
    if (fail_removes_.load() > 0) {
      --fail_removes_;
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::WORKFLOW::STORAGE_UNAVAILABLE, "store is down"));
    }
    return inner_.remove(prefix, id);
  }
  monad::MyResult<bool>
  compare_and_put(const std::string &prefix, const std::string &id,
                  const std::optional<std::string> &expected,
                  const std::string &value) override {
    if (fail_puts_.load()) {
      return monad::MyResult<bool>::Err(monad::make_error(
          my_errors::WORKFLOW::STORAGE_UNAVAILABLE, "store is down"));
    }
    return inner_.compare_and_put(prefix, id, expected, value);
  }

  void set_fail_puts(bool fail) { fail_puts_.store(fail); }
  void fail_next_removes(int count) { fail_removes_.store(count); }

private:
  kubeplane::storage::InMemoryKeyValueStore inner_;
  std::atomic<bool> fail_puts_{false};
  std::atomic<int> fail_removes_{0};
};

inline monad::Result<void, monad::Error>
await(const kubeplane::workflows::TaskCompletion::Ptr &completion,
      std::chrono::seconds timeout = std::chrono::seconds(10)) {
  std::promise<monad::Result<void, monad::Error>> promise;
  auto future = promise.get_future();
  completion->observe().run(
      [&promise](monad::Result<void, monad::Error> result) {
        promise.set_value(std::move(result));
      });
  if (future.wait_for(timeout) != std::future_status::ready) {
    return monad::Result<void, monad::Error>::Err(monad::make_error(
        my_errors::GENERAL::UNEXPECTED_RESULT, "completion timed out"));
  }
  return future.get();
}

// Config files in a temp dir plus the io_context and output the engine
// needs. Subclasses adjust the written config through `config_options_`
// before calling EngineFixture::SetUp().
class EngineFixture : public ::testing::Test {
protected:
  void SetUp() override {
    config_dir_ = make_temp_dir("kubeplane-config");
    runtime_dir_ = make_temp_dir("kubeplane-runtime");

    config_options_.runtime_dir = runtime_dir_;
    write_basic_config_files(config_dir_, config_options_);

    config_sources_ = make_config_sources({config_dir_}, {});
    app_properties_ = std::make_unique<cjj365::AppProperties>(*config_sources_);
    output_backend_ =
        std::make_unique<customio::ConsoleOutputWithColor>(test_log_level());
    console_output_ =
        std::make_unique<customio::ConsoleOutput>(*output_backend_);
    ioc_config_provider_ = std::make_unique<cjj365::IocConfigProviderFile>(
        *app_properties_, *config_sources_);
    config_provider_ = std::make_unique<kubeplane::KubeplaneConfigProviderFile>(
        *app_properties_, *config_sources_, *output_backend_);
    io_context_manager_ = std::make_unique<cjj365::IoContextManager>(
        *ioc_config_provider_, *output_backend_);

    repository_ = std::make_unique<kubeplane::workflows::TaskRepository>(
        store_, *console_output_);
  }

  void TearDown() override {
    if (io_context_manager_) {
      io_context_manager_->stop();
    }
    release_services();
    engine_.reset();
    registry_provider_.reset();
    repository_.reset();
    io_context_manager_.reset();
    config_provider_.reset();
    ioc_config_provider_.reset();
    console_output_.reset();
    output_backend_.reset();
    app_properties_.reset();
    config_sources_.reset();
    cjj365::ConfigSources::instance_count.store(0);

    std::error_code ec;
    fs::remove_all(config_dir_, ec);
    fs::remove_all(runtime_dir_, ec);
  }

  // Runs after the io_context stopped, before the engine is released.
  virtual void release_services() {}

  void make_engine(std::shared_ptr<const kubeplane::workflows::WorkflowRegistry>
                       registry) {
    registry_provider_ =
        std::make_unique<kubeplane::workflows::StaticWorkflowRegistryProvider>(
            std::move(registry));
    engine_ = std::make_shared<kubeplane::workflows::TaskEngine>(
        *io_context_manager_, *registry_provider_, *repository_,
        *console_output_);
  }

  ConfigFileOptions config_options_;
  fs::path config_dir_;
  fs::path runtime_dir_;
  std::unique_ptr<cjj365::ConfigSources> config_sources_;
  std::unique_ptr<cjj365::AppProperties> app_properties_;
  std::unique_ptr<customio::ConsoleOutputWithColor> output_backend_;
  std::unique_ptr<customio::ConsoleOutput> console_output_;
  std::unique_ptr<cjj365::IocConfigProviderFile> ioc_config_provider_;
  std::unique_ptr<kubeplane::KubeplaneConfigProviderFile> config_provider_;
  std::unique_ptr<cjj365::IoContextManager> io_context_manager_;
  FlakyKeyValueStore store_;
  std::unique_ptr<kubeplane::workflows::TaskRepository> repository_;
  std::unique_ptr<kubeplane::workflows::StaticWorkflowRegistryProvider>
      registry_provider_;
  std::shared_ptr<kubeplane::workflows::TaskEngine> engine_;
};

} // namespace testinfra
