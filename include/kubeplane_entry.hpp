#pragma once

#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>

#include "accounts/account_getter.hpp"
#include "boost/di.hpp"
#include "cluster/cluster_operations.hpp"
#include "conf/kubeplane_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/cluster_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/tasks_handler.hpp"
#include "handlers/workflows_handler.hpp"
#include "io_context_manager.hpp"
#include "ioc_manager_config_provider.hpp"
#include "kubeplane_common.hpp"
#include "misc_util.hpp"
#include "my_error_codes.hpp"
#include "storage/cluster_store.hpp"
#include "storage/sqlite_key_value_store.hpp"
#include "workflows/default_workflows.hpp"
#include "workflows/log_sink.hpp"
#include "workflows/node_provisioner.hpp"
#include "workflows/run_context.hpp"
#include "workflows/task_engine.hpp"
#include "workflows/task_repository.hpp"

#ifdef to
#error "macro to defined"
#endif

namespace di = boost::di;
namespace kubeplane {

// Wiring for the object graph shared by the CLI and the integration tests.
// Everything bound here lives as long as the injector.
inline auto make_core_module(cjj365::ConfigSources &config_sources,
                             customio::IOutput &output) {
  return di::make_injector(
      di::bind<cjj365::ConfigSources>().to(config_sources),
      di::bind<customio::IOutput>().to(output),
      di::bind<cjj365::IIocConfigProvider>()
          .to<cjj365::IocConfigProviderFile>(),
      di::bind<IKubeplaneConfigProvider>()
          .to<KubeplaneConfigProviderFile>()
          .in(di::singleton),
      di::bind<storage::IKeyValueStore>()
          .to<storage::SqliteKeyValueStore>()
          .in(di::singleton),
      di::bind<workflows::IWorkflowRegistryProvider>()
          .to<workflows::DefaultWorkflowRegistryProvider>()
          .in(di::singleton),
      di::bind<workflows::ILogSinkFactory>()
          .to<workflows::FileLogSinkFactory>()
          .in(di::singleton),
      di::bind<accounts::IAccountGetter>()
          .to<accounts::ConfigAccountGetter>()
          .in(di::singleton),
      di::bind<workflows::TaskEngine>().in(di::singleton),
      di::bind<workflows::NodeProvisioner>().in(di::singleton),
      di::bind<cluster::ClusterOperations>().in(di::singleton));
}

class App : public std::enable_shared_from_this<App> {
  misc::Blocker blocker_;
  kubeplane::CliCtx &cli_ctx_;
  customio::ConsoleOutput *output_hub_{nullptr};
  std::once_flag shutdown_once_flag_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  cjj365::ConfigSources &config_sources_;
  cjj365::IoContextManager *io_context_manager_{nullptr};
  // Parent of every task started in this session; SIGINT cancels it.
  workflows::RunContext::Ptr session_ctx_;

public:
  App(cjj365::ConfigSources &config_sources, kubeplane::CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), config_sources_(config_sources),
        session_ctx_(workflows::RunContext::with_cancel(
            workflows::RunContext::background())) {}

  void print_error(const monad::Error &err) {
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else {
      output_hub_->logger().error() << err << std::endl;
    }
  }

  int exit_code() const { return exit_code_; }

  void start() {
    static customio::ConsoleOutputWithColor output_hub(
        cli_ctx_.verbosity_level());

    auto handler_module = [this]() {
      return di::make_injector(
          di::bind<workflows::RunContext>().to(session_ctx_),
          di::bind<kubeplane::ClusterHandler>().in(di::unique),
          di::bind<kubeplane::TasksHandler>().in(di::unique),
          di::bind<kubeplane::WorkflowsHandler>().in(di::unique),
          di::bind<kubeplane::IHandlerFactory>().to(
              [](const auto &inj) -> kubeplane::IHandlerFactory & {
                static kubeplane::HandlerFactoryImpl factory(
                    [&inj](const std::string &subcmd)
                        -> std::shared_ptr<kubeplane::IHandler> {
                      if (subcmd == "cluster") {
                        return inj.template create<
                            std::shared_ptr<kubeplane::ClusterHandler>>();
                      } else if (subcmd == "tasks") {
                        return inj.template create<
                            std::shared_ptr<kubeplane::TasksHandler>>();
                      } else if (subcmd == "workflows") {
                        return inj.template create<
                            std::shared_ptr<kubeplane::WorkflowsHandler>>();
                      } else {
                        throw std::runtime_error("Unsupported subcommand: " +
                                                 subcmd);
                      }
                    });
                return factory;
              }));
    };

    auto injector =
        di::make_injector(handler_module(),
                          make_core_module(config_sources_, output_hub),
                          di::bind<kubeplane::CliCtx>().to(cli_ctx_));

    io_context_manager_ =
        &injector.template create<cjj365::IoContextManager &>();
    output_hub_ = &injector.template create<customio::ConsoleOutput &>();
    auto self = this->shared_from_this();

    output_hub_->logger().debug() << "Config source directories:" << std::endl;
    for (const auto &source : config_sources_.paths_) {
      output_hub_->logger().debug() << " - " << source.string() << std::endl;
    }

    auto &dispatcher =
        injector.template create<kubeplane::HandlerDispatcher &>();

    bool dispatched =
        dispatcher.dispatch_run(cli_ctx_.params.subcmd, [self](auto r) {
          if (r.is_err()) {
            self->print_error(r.error());
            self->exit_code_ = EXIT_FAILURE;
          } else {
            self->output_hub_->logger().debug()
                << "Handler completed successfully." << std::endl;
          }
          return self->blocker_.stop();
        });

    if (!dispatched) {
      output_hub_->logger().error()
          << "No valid subcommand provided. Available: cluster, tasks, "
             "workflows."
          << std::endl;
      exit_code_ = EXIT_FAILURE;
      return shutdown();
    }

    signals_ = std::make_unique<boost::asio::signal_set>(
        io_context_manager_->ioc(), SIGINT, SIGTERM);
    await_signal();
    blocker_.wait();
    output_hub_->logger().debug()
        << "blocker_.wait() returned, start() exiting." << std::endl;
    shutdown();
  }

  void shutdown() {
    auto self = this->shared_from_this();
    std::call_once(shutdown_once_flag_, [self] {
      self->output_hub_->logger().debug()
          << "Shutting down App..." << std::endl;
      if (self->signals_) {
        boost::system::error_code ec;
        self->signals_->cancel(ec);
        self->signals_.reset();
      }
      self->session_ctx_->cancel("shutting down");
      self->io_context_manager_->stop();
      self->output_hub_->logger().debug()
          << "App shutdown completed." << std::endl;
    });
  }

private:
  // First signal cancels the running tasks and lets them fail; a second one
  // stops waiting for them.
  void await_signal() {
    auto self = this->shared_from_this();
    signals_->async_wait(
        [self](const boost::system::error_code &error, int signal) {
          if (error) {
            return;
          }
          const char *signal_name = (signal == SIGINT) ? "SIGINT" : "SIGTERM";
          if (self->session_ctx_->cancelled()) {
            std::cerr << signal_name << " received again. Stopping."
                      << std::endl;
            self->exit_code_ = EXIT_FAILURE;
            self->blocker_.stop();
            return;
          }
          std::cerr << signal_name << " received. Cancelling running tasks..."
                    << std::endl;
          self->session_ctx_->cancel(fmt::format("{} received", signal_name));
          if (self->signals_) {
            self->await_signal();
          }
        });
  }

  int exit_code_{EXIT_SUCCESS};
};

inline int launch(cjj365::ConfigSources &config, kubeplane::CliCtx &ctx) {
  auto app = std::make_shared<kubeplane::App>(config, ctx);
  app->start();
  return app->exit_code();
}

} // namespace kubeplane
